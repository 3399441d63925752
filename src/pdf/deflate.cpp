// src/pdf/deflate.cpp
#include "papermake/pdf/deflate.h"
#include <zlib.h>
#include <cstring>

namespace papermake {

bool deflate_stream(std::string_view input, std::string& output, std::string& error) {
    z_stream stream;
    std::memset(&stream, 0, sizeof(stream));
    if (deflateInit(&stream, Z_BEST_COMPRESSION) != Z_OK) {
        error = "deflateInit failed";
        return false;
    }

    output.clear();
    output.resize(deflateBound(&stream, static_cast<uLong>(input.size())));

    stream.next_in = reinterpret_cast<Bytef*>(const_cast<char*>(input.data()));
    stream.avail_in = static_cast<uInt>(input.size());
    stream.next_out = reinterpret_cast<Bytef*>(output.data());
    stream.avail_out = static_cast<uInt>(output.size());

    int ret = deflate(&stream, Z_FINISH);
    if (ret != Z_STREAM_END) {
        error = stream.msg ? stream.msg : "deflate did not finish";
        deflateEnd(&stream);
        return false;
    }

    output.resize(stream.total_out);
    deflateEnd(&stream);
    return true;
}

bool inflate_stream(std::string_view input, std::string& output, std::string& error) {
    z_stream stream;
    std::memset(&stream, 0, sizeof(stream));
    if (inflateInit(&stream) != Z_OK) {
        error = "inflateInit failed";
        return false;
    }

    stream.next_in = reinterpret_cast<Bytef*>(const_cast<char*>(input.data()));
    stream.avail_in = static_cast<uInt>(input.size());

    output.clear();
    char buffer[16384];
    int ret = Z_OK;
    do {
        stream.next_out = reinterpret_cast<Bytef*>(buffer);
        stream.avail_out = sizeof(buffer);
        ret = inflate(&stream, Z_NO_FLUSH);
        if (ret != Z_OK && ret != Z_STREAM_END) {
            error = stream.msg ? stream.msg : "inflate failed";
            inflateEnd(&stream);
            return false;
        }
        output.append(buffer, sizeof(buffer) - stream.avail_out);
    } while (ret != Z_STREAM_END && (stream.avail_in > 0 || stream.avail_out == 0));

    inflateEnd(&stream);
    if (ret != Z_STREAM_END) {
        error = "truncated deflate stream";
        return false;
    }
    return true;
}

} // namespace papermake
