/**
 * LSV Inspector - Entry Point
 *
 * CLI usage:
 *   lsv_inspect --list <save.lsv>
 *   lsv_inspect --dump <save.lsv> --member <name>
 *   lsv_inspect --blob <save.lsv> --member <name> --path <a/b> --attr <name> [--output <file>]
 *   lsv_inspect --extract <save.lsv> --member <name> [--output <file>]
 *   lsv_inspect --globals <save.lsv>
 *   lsv_inspect --help
 */

#include "lsv/extractor.hpp"
#include "lsv/files.hpp"
#include "lsv/logging.hpp"
#include "lsv/package_reader.hpp"
#include "lsv/settings.hpp"
#include "lsv/value_decoder.hpp"

#include <iomanip>
#include <iostream>
#include <string>
#include <vector>
#include <filesystem>

// CLI argument parsing
struct CliArgs {
    bool show_help = false;
    bool list_mode = false;
    bool dump_mode = false;
    bool blob_mode = false;
    bool extract_mode = false;
    bool globals_mode = false;
    std::string package_path;
    std::string member;
    std::string node_path;
    std::string attribute;
    std::string output;
    std::string config_path;
    std::string write_config_path;
    bool verbose = false;
    std::vector<std::string> errors;
};

void print_help() {
    std::cout << R"(
LSV Inspector - Baldur's Gate 3 save (.lsv) reader

Usage:
  lsv_inspect --help                                  Show this help
  lsv_inspect --list <save.lsv>                       List members of a save package
  lsv_inspect --dump <save.lsv> --member <name>       Print a resource's node tree with values
  lsv_inspect --blob <save.lsv> --member <name> --path <a/b> --attr <name> [--output <file>]
  lsv_inspect --extract <save.lsv> --member <name> [--output <file>]
  lsv_inspect --globals <save.lsv>                    Print the regions of Globals.lsf

Options:
  --help, -h              Show this help message
  --list, -l <pkg>        List members with sizes and compression
  --dump, -d <pkg>        Decode a member and print every node and attribute
  --blob, -b <pkg>        Extract a ScratchBuffer attribute (hex to stdout, or raw to --output)
  --extract, -e <pkg>     Write a member's decompressed bytes to disk
  --globals, -g <pkg>     Decode Globals.lsf
  --member, -m <name>     Package member (e.g. Globals.lsf)
  --path, -p <a/b>        Node path: region name, then child names, separated by '/'
  --attr, -a <name>       Attribute name
  --output, -o <file>     Output file
  --config, -c <file>     Load settings from a JSON file
  --write-config <file>   Write the effective settings to a JSON file
  --verbose, -v           Debug logging to the console

Examples:
  lsv_inspect --list QuickSave_1.lsv
  lsv_inspect --dump QuickSave_1.lsv --member Globals.lsf
  lsv_inspect --blob QuickSave_1.lsv -m Globals.lsf -p Globals/Party -a Data -o party.bin

)" << std::endl;
}

CliArgs parse_args(int argc, char* argv[]) {
    CliArgs args;

    auto take_value = [&](int& i, const std::string& flag, std::string& target) {
        if (i + 1 < argc) {
            target = argv[++i];
        } else {
            args.errors.push_back("Missing value for " + flag);
        }
    };

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];

        if (arg == "--help" || arg == "-h") {
            args.show_help = true;
        }
        else if (arg == "--list" || arg == "-l") {
            args.list_mode = true;
            take_value(i, arg, args.package_path);
        }
        else if (arg == "--dump" || arg == "-d") {
            args.dump_mode = true;
            take_value(i, arg, args.package_path);
        }
        else if (arg == "--blob" || arg == "-b") {
            args.blob_mode = true;
            take_value(i, arg, args.package_path);
        }
        else if (arg == "--extract" || arg == "-e") {
            args.extract_mode = true;
            take_value(i, arg, args.package_path);
        }
        else if (arg == "--globals" || arg == "-g") {
            args.globals_mode = true;
            take_value(i, arg, args.package_path);
        }
        else if (arg == "--member" || arg == "-m") {
            take_value(i, arg, args.member);
        }
        else if (arg == "--path" || arg == "-p") {
            take_value(i, arg, args.node_path);
        }
        else if (arg == "--attr" || arg == "-a") {
            take_value(i, arg, args.attribute);
        }
        else if (arg == "--output" || arg == "-o") {
            take_value(i, arg, args.output);
        }
        else if (arg == "--config" || arg == "-c") {
            take_value(i, arg, args.config_path);
        }
        else if (arg == "--write-config") {
            take_value(i, arg, args.write_config_path);
        }
        else if (arg == "--verbose" || arg == "-v") {
            args.verbose = true;
        }
        else {
            args.errors.push_back("Unknown option: " + arg);
        }
    }

    return args;
}

static void report(const lsv::Error& error) {
    std::cerr << "Error: " << lsv::error_code_string(error.code) << ": " << error.full_message() << "\n";
}

static void print_node(const lsv::ResourceDocument& doc, size_t node, int depth) {
    std::string indent(static_cast<size_t>(depth) * 2, ' ');
    std::cout << indent << doc.node_name(node) << "\n";

    for (size_t a : doc.attributes(node)) {
        const auto& attr = doc.attributes()[a];
        std::cout << indent << "  @" << doc.attribute_name(a) << " (" << lsv::data_type_string(attr.type) << ") = ";

        auto value = lsv::decode_value(doc, attr);
        if (value) {
            std::cout << value->to_string() << "\n";
        } else {
            std::cout << "<" << lsv::error_code_string(value.code()) << ": " << value.error().message << ">\n";
        }
    }

    for (size_t child : doc.children(node)) {
        print_node(doc, child, depth + 1);
    }
}

static void print_document(const lsv::ResourceDocument& doc) {
    const auto& format = doc.format();
    std::cout << "LSOF v" << format.lsof_version << ", engine " << format.engine_version.to_string()
              << ", " << lsv::node_layout_string(format.layout()) << " layout, "
              << doc.node_count() << " nodes, " << doc.attribute_count() << " attributes\n\n";

    for (size_t root : doc.roots()) {
        print_node(doc, root, 0);
    }
}

static int run_list(const lsv::Package& package, const CliArgs& args) {
    for (const auto& entry : package.entries()) {
        std::cout << entry.name;
        std::cout << "  " << lsv::format_file_size(entry.size())
                  << " (" << lsv::compression_method_string(entry.compression);
        if (entry.is_compressed()) {
            std::cout << ", " << lsv::format_file_size(entry.size_on_disk) << " on disk";
        }
        if (args.verbose) {
            std::cout << ", part " << static_cast<int>(entry.archive_part) << " @" << entry.offset;
        }
        std::cout << ")\n";
    }
    std::cout << "\nMembers: " << package.file_count() << ", total "
              << lsv::format_file_size(package.total_size()) << " ("
              << lsv::format_file_size(package.compressed_size()) << " on disk)\n";
    return 0;
}

static lsv::Result<const lsv::FileEntry*> checked_member(const lsv::Package& package, const std::string& name,
                                                         const lsv::Settings& settings) {
    const lsv::FileEntry* entry = package.find_entry(name);
    if (!entry) {
        return lsv::Error::not_found("Package member", name);
    }
    if (settings.max_member_size != 0 && entry->size() > settings.max_member_size) {
        return lsv::Error::invalid_argument("Member of " + lsv::format_file_size(entry->size()) +
                                            " exceeds max_member_size", name);
    }
    return entry;
}

int run_cli(const CliArgs& args, const lsv::Settings& settings) {
    if (args.package_path.empty()) {
        std::cerr << "Error: No save package specified\n";
        print_help();
        return 1;
    }

    auto bytes = lsv::read_file(args.package_path, settings.max_package_size);
    if (!bytes) {
        report(bytes.error());
        return 1;
    }

    auto package = lsv::PackageReader::open(std::move(*bytes));
    if (!package) {
        report(package.error());
        return 1;
    }

    if (args.list_mode) {
        return run_list(*package, args);
    }

    if (args.globals_mode) {
        if (auto entry = package->find_entry_nocase(lsv::GLOBALS_MEMBER)) {
            auto checked = checked_member(*package, entry->name, settings);
            if (!checked) {
                report(checked.error());
                return 1;
            }
        }
        auto doc = lsv::load_globals(*package);
        if (!doc) {
            report(doc.error());
            return 1;
        }
        for (size_t root : doc->roots()) {
            std::cout << doc->node_name(root) << " (" << doc->children(root).size() << " children)\n";
        }
        return 0;
    }

    if (args.member.empty()) {
        std::cerr << "Error: No member specified (use --member)\n";
        return 1;
    }

    auto entry = checked_member(*package, args.member, settings);
    if (!entry) {
        report(entry.error());
        return 1;
    }

    if (args.extract_mode) {
        auto data = lsv::PackageReader::read_member(*package, **entry);
        if (!data) {
            report(data.error());
            return 1;
        }

        std::filesystem::path out_path;
        if (!args.output.empty()) {
            out_path = args.output;
        } else {
            auto resolved = lsv::output_path_for(settings.output_dir, args.member);
            if (!resolved) {
                report(resolved.error());
                return 1;
            }
            out_path = *resolved;
        }

        auto written = lsv::write_file(out_path, *data);
        if (!written) {
            report(written.error());
            return 1;
        }
        std::cout << "Extracted " << args.member << " -> " << out_path.string()
                  << " (" << lsv::format_file_size(data->size()) << ")\n";
        return 0;
    }

    auto doc = lsv::extract_document(*package, args.member);
    if (!doc) {
        report(doc.error());
        return 1;
    }

    if (args.dump_mode) {
        print_document(*doc);
        return 0;
    }

    if (args.blob_mode) {
        if (args.attribute.empty()) {
            std::cerr << "Error: No attribute specified (use --attr)\n";
            return 1;
        }

        auto blob = lsv::blob_at(*doc, lsv::split_node_path(args.node_path), args.attribute);
        if (!blob) {
            report(blob.error());
            return 1;
        }

        if (!args.output.empty()) {
            auto written = lsv::write_file(args.output, *blob);
            if (!written) {
                report(written.error());
                return 1;
            }
            std::cout << "Wrote " << blob->size() << " bytes to " << args.output << "\n";
            return 0;
        }

        std::cout << std::hex << std::setfill('0');
        for (size_t i = 0; i < blob->size(); ++i) {
            std::cout << std::setw(2) << static_cast<int>((*blob)[i]) << ((i % 16 == 15) ? '\n' : ' ');
        }
        std::cout << std::dec << "\n";
        return 0;
    }

    std::cerr << "Error: No action specified\n";
    print_help();
    return 1;
}

int main(int argc, char* argv[]) {
    // Parse command line arguments
    CliArgs args = parse_args(argc, argv);

    if (args.show_help) {
        print_help();
        return 0;
    }

    for (const auto& error : args.errors) {
        std::cerr << "Error: " << error << "\n";
    }
    if (!args.errors.empty()) {
        return 1;
    }

    lsv::Settings settings;
    if (!args.config_path.empty()) {
        if (!std::filesystem::exists(args.config_path)) {
            std::cerr << "Error: Settings file not found: " << args.config_path << "\n";
            return 1;
        }
        settings = lsv::load_settings(args.config_path);
    }

    // Enable debug logging if requested
    if (args.verbose) {
        settings.log_level = lsv::LogLevel::Debug;
        settings.console_log = true;
    }

    auto logging = lsv::apply_logging(settings);
    if (!logging) {
        report(logging.error());
    }

    if (!args.write_config_path.empty()) {
        auto saved = lsv::save_settings(settings, args.write_config_path);
        if (!saved) {
            report(saved.error());
            return 1;
        }
        std::cout << "Settings written to " << args.write_config_path << "\n";
        if (args.package_path.empty()) {
            return 0;
        }
    }

    int result = run_cli(args, settings);
    lsv::Logger::instance().close_file();
    return result;
}
