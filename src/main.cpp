#include "block_parser.hpp"
#include "config.hpp"
#include "patch_applier.hpp"
#include "prompt.hpp"
#include "report.hpp"
#include "util.hpp"
#include <cstring>
#include <fstream>
#include <iostream>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>

namespace {

struct CliOptions {
    std::string command;
    std::string file;
    std::string reply_path;   // empty = stdin
    std::string message;
    bool write = false;
    bool force = false;
    bool json = false;
    bool preview = false;
    bool verbose = false;
    std::optional<double> threshold;
    std::optional<uint32_t> tolerance;
};

} // namespace

static void print_usage() {
    std::cout << "Usage: patchkit <command> [options]\n"
              << "\n"
              << "Commands:\n"
              << "  apply FILE           Apply the edit blocks of a model reply to FILE\n"
              << "  parse                List the edit blocks found in a model reply\n"
              << "  prompt FILE -m MSG   Print the prompt asking a model to edit FILE\n"
              << "\n"
              << "Options:\n"
              << "  --reply PATH         Read the model reply from PATH (default: stdin)\n"
              << "  --write              Write the result back to FILE\n"
              << "  --force              Write even if some blocks were not found\n"
              << "  --json               Print a JSON report instead of text\n"
              << "  --preview            Print a diff preview of every block\n"
              << "  --threshold X        Fuzzy similarity threshold (0..1)\n"
              << "  --tolerance N        Fuzzy window tolerance in lines\n"
              << "  -m, --message MSG    Edit instructions for the prompt command\n"
              << "  -v, --verbose        Log per-block progress\n"
              << "  -h, --help           Show this help\n"
              << "\n"
              << "Environment variables:\n"
              << "  PATCHKIT_FUZZY_THRESHOLD   Override match.fuzzy_threshold\n"
              << "  PATCHKIT_WINDOW_TOLERANCE  Override match.window_tolerance\n"
              << "\n"
              << "Exit status: 0 all blocks applied, 2 some blocks not applied, 1 error.\n";
}

static std::optional<double> parse_double(const char* s) {
    try {
        size_t used = 0;
        double v = std::stod(s, &used);
        if (used != std::strlen(s)) return std::nullopt;
        return v;
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

static std::optional<uint32_t> parse_count(const char* s) {
    try {
        size_t used = 0;
        unsigned long v = std::stoul(s, &used);
        if (used != std::strlen(s) || v > 1000) return std::nullopt;
        return static_cast<uint32_t>(v);
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

// Streams the reply through the block parser in chunks
static std::optional<patchkit::ParsedReply> read_reply(const std::string& path, bool verbose) {
    std::ifstream file;
    std::istream* in = &std::cin;
    if (!path.empty()) {
        file.open(path, std::ios::binary);
        if (!file.is_open()) return std::nullopt;
        in = &file;
    }

    patchkit::BlockParser parser;
    auto on_block = [verbose](const patchkit::EditInstruction& ins) {
        if (verbose) {
            std::cerr << "[parse] Block #" << (ins.order_index + 1) << " received\n";
        }
    };

    char buf[4096];
    while (in->read(buf, sizeof(buf)) || in->gcount() > 0) {
        parser.feed(std::string(buf, static_cast<size_t>(in->gcount())), on_block);
    }
    return parser.finish(on_block);
}

static void log_diagnostics(const patchkit::ParsedReply& reply) {
    for (const auto& d : reply.diagnostics) {
        std::cerr << "[parse] Line " << d.line << ": " << d.message << "\n";
    }
}

static nlohmann::json diagnostics_json(const patchkit::ParsedReply& reply) {
    nlohmann::json arr = nlohmann::json::array();
    for (const auto& d : reply.diagnostics) {
        arr.push_back({{"line", d.line}, {"message", d.message}});
    }
    return arr;
}

static int run_apply(const CliOptions& opts, const patchkit::Config& config) {
    auto content = patchkit::read_file(opts.file);
    if (!content) {
        std::cerr << "Error: cannot read " << opts.file << "\n";
        return 1;
    }
    auto reply = read_reply(opts.reply_path, opts.verbose);
    if (!reply) {
        std::cerr << "Error: cannot read reply " << opts.reply_path << "\n";
        return 1;
    }
    log_diagnostics(*reply);
    if (opts.verbose && !reply->summary.empty()) {
        std::cerr << "[parse] Summary: " << reply->summary << "\n";
    }

    patchkit::PatchApplier applier(config.match);
    patchkit::PatchResult result = applier.apply(*content, reply->instructions);

    if (opts.verbose) {
        for (size_t i = 0; i < result.applied_blocks.size(); ++i) {
            std::cerr << "[apply] Block #" << (i + 1) << ": "
                      << patchkit::badge_text(result.applied_blocks[i]) << "\n";
        }
    }

    if (opts.json) {
        nlohmann::json j = patchkit::report_json(result, *content);
        j["summary"] = reply->summary;
        j["diagnostics"] = diagnostics_json(*reply);
        std::cout << j.dump(2) << "\n";
    } else {
        std::cerr << patchkit::format_report(result, *content);
    }

    if (opts.preview) {
        for (size_t i = 0; i < result.applied_blocks.size(); ++i) {
            std::cerr << "\n" << patchkit::render_block_preview(
                *content, result.applied_blocks[i], i + 1);
        }
    }

    if (opts.write) {
        if (!result.is_fully_applied() && !opts.force) {
            std::cerr << "[apply] Not writing " << opts.file
                      << ": some blocks were not applied (use --force)\n";
            return 2;
        }
        if (result.total_applied > 0) {
            if (!patchkit::atomic_write_file(opts.file, result.new_content)) {
                std::cerr << "Error: failed to write " << opts.file << "\n";
                return 1;
            }
            std::cerr << "[apply] Wrote " << opts.file << "\n";
        }
    } else if (!opts.json) {
        std::cout << result.new_content;
    }

    return result.is_fully_applied() ? 0 : 2;
}

static int run_parse(const CliOptions& opts) {
    auto reply = read_reply(opts.reply_path, opts.verbose);
    if (!reply) {
        std::cerr << "Error: cannot read reply " << opts.reply_path << "\n";
        return 1;
    }
    log_diagnostics(*reply);

    if (opts.json) {
        nlohmann::json blocks = nlohmann::json::array();
        for (const auto& ins : reply->instructions) {
            nlohmann::json b = {
                {"order_index", ins.order_index},
                {"search", ins.search},
                {"replace", ins.replace}
            };
            if (ins.line_hint) b["line_hint"] = *ins.line_hint;
            else b["line_hint"] = nullptr;
            blocks.push_back(std::move(b));
        }
        nlohmann::json j = {
            {"blocks", std::move(blocks)},
            {"summary", reply->summary},
            {"diagnostics", diagnostics_json(*reply)}
        };
        std::cout << j.dump(2) << "\n";
        return 0;
    }

    if (reply->empty()) {
        std::cout << "No changes\n";
        return 0;
    }
    for (const auto& ins : reply->instructions) {
        std::cout << "#" << (ins.order_index + 1);
        if (ins.line_hint) std::cout << " (near line " << *ins.line_hint << ")";
        std::cout << "\n--- search\n" << ins.search
                  << "\n+++ replace\n" << ins.replace << "\n\n";
    }
    if (!reply->summary.empty()) {
        std::cout << "Summary: " << reply->summary << "\n";
    }
    return 0;
}

static int run_prompt(const CliOptions& opts, const patchkit::Config& config) {
    if (opts.message.empty()) {
        std::cerr << "Error: prompt requires -m MESSAGE\n";
        return 1;
    }
    auto content = patchkit::read_file(opts.file);
    if (!content) {
        std::cerr << "Error: cannot read " << opts.file << "\n";
        return 1;
    }

    bool numbered = patchkit::should_number_lines(*content, config.prompt.line_number_threshold);
    std::string system = patchkit::build_edit_system_prompt(numbered);
    std::string user = patchkit::build_edit_user_message(*content, opts.file, opts.message,
                                                         numbered);
    if (opts.json) {
        nlohmann::json j = {{"system", system}, {"user", user}};
        std::cout << j.dump(2) << "\n";
    } else {
        std::cout << "=== SYSTEM ===\n" << system << "\n=== USER ===\n" << user;
    }
    return 0;
}

int main(int argc, char* argv[]) try {
    CliOptions opts;

    for (int i = 1; i < argc; i++) {
        if (std::strcmp(argv[i], "-h") == 0 || std::strcmp(argv[i], "--help") == 0) {
            print_usage();
            return 0;
        } else if (std::strcmp(argv[i], "--reply") == 0 && i + 1 < argc) {
            opts.reply_path = argv[++i];
        } else if ((std::strcmp(argv[i], "-m") == 0 || std::strcmp(argv[i], "--message") == 0) && i + 1 < argc) {
            opts.message = argv[++i];
        } else if (std::strcmp(argv[i], "--threshold") == 0 && i + 1 < argc) {
            opts.threshold = parse_double(argv[++i]);
            if (!opts.threshold || *opts.threshold < 0.0 || *opts.threshold > 1.0) {
                std::cerr << "Invalid --threshold: " << argv[i] << "\n";
                return 1;
            }
        } else if (std::strcmp(argv[i], "--tolerance") == 0 && i + 1 < argc) {
            opts.tolerance = parse_count(argv[++i]);
            if (!opts.tolerance) {
                std::cerr << "Invalid --tolerance: " << argv[i] << "\n";
                return 1;
            }
        } else if (std::strcmp(argv[i], "--write") == 0) {
            opts.write = true;
        } else if (std::strcmp(argv[i], "--force") == 0) {
            opts.force = true;
        } else if (std::strcmp(argv[i], "--json") == 0) {
            opts.json = true;
        } else if (std::strcmp(argv[i], "--preview") == 0) {
            opts.preview = true;
        } else if (std::strcmp(argv[i], "-v") == 0 || std::strcmp(argv[i], "--verbose") == 0) {
            opts.verbose = true;
        } else if (argv[i][0] != '-' && opts.command.empty()) {
            opts.command = argv[i];
        } else if (argv[i][0] != '-' && opts.file.empty()) {
            opts.file = argv[i];
        } else {
            std::cerr << "Unknown option: " << argv[i] << "\n";
            print_usage();
            return 1;
        }
    }

    if (opts.command.empty()) {
        print_usage();
        return 1;
    }

    auto config = patchkit::Config::load();

    // Override config with CLI args
    if (opts.threshold) config.match.fuzzy_threshold = *opts.threshold;
    if (opts.tolerance) config.match.window_tolerance = *opts.tolerance;

    if (opts.command == "parse") {
        return run_parse(opts);
    }
    if (opts.command == "apply" || opts.command == "prompt") {
        if (opts.file.empty()) {
            std::cerr << "Error: " << opts.command << " requires a FILE argument\n";
            return 1;
        }
        return opts.command == "apply" ? run_apply(opts, config) : run_prompt(opts, config);
    }

    std::cerr << "Unknown command: " << opts.command << "\n";
    print_usage();
    return 1;
} catch (const std::exception& e) {
    std::cerr << "Fatal error: " << e.what() << '\n';
    return 1;
}
