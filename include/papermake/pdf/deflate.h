// papermake/pdf/deflate.h
#ifndef PAPERMAKE_PDF_DEFLATE_H
#define PAPERMAKE_PDF_DEFLATE_H

#include <string>
#include <string_view>

namespace papermake {

// zlib stream (RFC 1950) as expected by the PDF FlateDecode filter.
// Returns false and fills error on failure; output is then unspecified.
bool deflate_stream(std::string_view input, std::string& output, std::string& error);

// Inverse of deflate_stream, used to inspect generated PDFs
bool inflate_stream(std::string_view input, std::string& output, std::string& error);

} // namespace papermake

#endif // PAPERMAKE_PDF_DEFLATE_H
