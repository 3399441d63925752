// examples/cli/main.cpp
#include "papermake/common/error.h"
#include "papermake/common/log.h"
#include "papermake/config/config.h"
#include "papermake/render/render_service.h"
#include "papermake/schema/schema.h"
#include "papermake/storage/file_storage.h"
#include <fstream>
#include <iostream>
#include <map>
#include <sstream>
#include <string>
#include <vector>

using namespace papermake;

namespace {

void print_usage(const char* prog) {
    std::cerr << "Usage: " << prog << " [--config FILE] <command> ...\n"
              << "  list\n"
              << "  show <id>\n"
              << "  create <id> <name> <source-file> <schema-file> [--description TEXT]\n"
              << "  update <id> [--name N] [--source FILE] [--schema FILE] [--description TEXT]\n"
              << "  delete <id>\n"
              << "  render <id> <data.json> <out.pdf> [--paper SIZE] [--no-compress]\n"
              << "  files <id>\n"
              << "  get-file <id> <path> <out-file>\n"
              << "  put-file <id> <path> <in-file>\n"
              << "  rm-file <id> <path>\n";
}

std::string read_text(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open file: " + path);
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    return buffer.str();
}

void write_bytes(const std::string& path, const Bytes& bytes) {
    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot write file: " + path);
    }
    file.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
}

// Splits "--flag value" pairs (and bare "--no-compress") from positional arguments
struct Args {
    std::vector<std::string> positional;
    std::map<std::string, std::string> flags;

    bool has(const std::string& flag) const { return flags.count(flag) > 0; }
};

Args parse_args(const std::vector<std::string>& argv) {
    Args args;
    for (size_t i = 0; i < argv.size(); ++i) {
        const std::string& arg = argv[i];
        if (arg.rfind("--", 0) != 0) {
            args.positional.push_back(arg);
        } else if (arg == "--no-compress") {
            args.flags[arg] = "";
        } else if (i + 1 < argv.size()) {
            args.flags[arg] = argv[++i];
        } else {
            throw std::runtime_error("Missing value for " + arg);
        }
    }
    return args;
}

void require_positional(const Args& args, size_t count, const std::string& command) {
    if (args.positional.size() < count) {
        throw std::runtime_error("'" + command + "' expects " + std::to_string(count) + " arguments");
    }
}

void print_template(const Template& tpl) {
    nlohmann::json j = tpl.to_json();
    std::cout << j.dump(2) << "\n";
}

int run_render(RenderService& service, const Args& args) {
    require_positional(args, 3, "render");
    const TemplateId id{args.positional[0]};
    Value data = nlohmann::json::parse(read_text(args.positional[1]));

    RenderOptions options = service.config().render;
    if (args.has("--paper")) options.paper_size = args.flags.at("--paper");
    if (args.has("--no-compress")) options.compress = false;

    RenderResult result = service.render(id, data, options);
    switch (result.status) {
        case RenderStatus::SUCCEEDED:
            write_bytes(args.positional[2], *result.pdf);
            std::cout << "Wrote " << result.pdf->size() << " bytes to " << args.positional[2] << "\n";
            return 0;
        case RenderStatus::BAD_INPUT:
            std::cerr << "invalid data: " << result.validation_error->message << "\n";
            return 1;
        case RenderStatus::FAILED:
            for (const auto& error : result.errors) {
                std::cerr << "error: " << error.message << " (at " << error.start << ".." << error.end << ")\n";
            }
            return 1;
    }
    return 1;
}

int run_command(RenderService& service, const std::string& command, const Args& args) {
    Storage& storage = service.storage();

    if (command == "list") {
        for (const auto& tpl : storage.list_templates()) {
            std::cout << tpl.id().value << "\t" << tpl.name() << "\t" << format_timestamp(tpl.updated_at()) << "\n";
        }
        return 0;
    }
    if (command == "show") {
        require_positional(args, 1, command);
        print_template(storage.get_template(TemplateId{args.positional[0]}));
        return 0;
    }
    if (command == "create") {
        require_positional(args, 4, command);
        Template tpl(TemplateId{args.positional[0]}, args.positional[1],
                     read_text(args.positional[2]), Schema::from_yaml(read_text(args.positional[3])));
        if (args.has("--description")) {
            tpl = tpl.with_description(args.flags.at("--description"));
        }
        service.save_template(tpl);
        print_template(tpl);
        return 0;
    }
    if (command == "update") {
        require_positional(args, 1, command);
        TemplateUpdate changes;
        if (args.has("--name")) changes.name = args.flags.at("--name");
        if (args.has("--source")) changes.content = read_text(args.flags.at("--source"));
        if (args.has("--schema")) changes.schema = Schema::from_yaml(read_text(args.flags.at("--schema")));
        if (args.has("--description")) changes.description = args.flags.at("--description");
        const TemplateId id{args.positional[0]};
        service.update_template(id, changes);
        print_template(storage.get_template(id));
        return 0;
    }
    if (command == "delete") {
        require_positional(args, 1, command);
        service.delete_template(TemplateId{args.positional[0]});
        return 0;
    }
    if (command == "render") {
        return run_render(service, args);
    }
    if (command == "files") {
        require_positional(args, 1, command);
        for (const auto& path : storage.list_template_files(TemplateId{args.positional[0]})) {
            std::cout << path << "\n";
        }
        return 0;
    }
    if (command == "get-file") {
        require_positional(args, 3, command);
        write_bytes(args.positional[2], storage.get_template_file(TemplateId{args.positional[0]}, args.positional[1]));
        return 0;
    }
    if (command == "put-file") {
        require_positional(args, 3, command);
        const std::string content = read_text(args.positional[2]);
        storage.save_template_file(TemplateId{args.positional[0]}, args.positional[1],
                                   Bytes(content.begin(), content.end()));
        return 0;
    }
    if (command == "rm-file") {
        require_positional(args, 2, command);
        storage.delete_template_file(TemplateId{args.positional[0]}, args.positional[1]);
        return 0;
    }

    std::cerr << "Unknown command '" << command << "'\n";
    return 1;
}

} // namespace

int main(int argc, char* argv[]) {
    std::vector<std::string> raw(argv + 1, argv + argc);
    std::string config_path = "papermake.yaml";
    if (raw.size() >= 2 && raw[0] == "--config") {
        config_path = raw[1];
        raw.erase(raw.begin(), raw.begin() + 2);
    }
    if (raw.empty()) {
        print_usage(argv[0]);
        return 1;
    }

    const std::string command = raw.front();
    raw.erase(raw.begin());

    try {
        Config config = Config::load(config_path);
        config.apply_env_overrides();
        set_log_level(config.log_level);

        FileStorage storage(config.storage_path);
        RenderService service(storage, config);
        return run_command(service, command, parse_args(raw));
    } catch (const NotFoundError& e) {
        std::cerr << "not found: " << e.what() << std::endl;
        return 1;
    } catch (const std::exception& e) {
        log_error(e.what());
        return 1;
    }
}
