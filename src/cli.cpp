#include "cli.hpp"
#include "commands.hpp"
#include "compact_log.hpp"
#include <string>
#include <vector>
#include <chrono>
#include <charconv>

namespace chkr {

namespace {

enum class FSMState {
    Init,
    ParseArgs,
    PreCommand,
    RunCommand,
    PostCommand,
    Error,
    Done
};

struct FSMContext {
    int argc;
    char** argv;
    std::string cmd;
    std::vector<std::string> args;
    CliOptions options;
    bool help = false;
    int exit_code = 0;
    std::string error_message;
    std::chrono::steady_clock::time_point start_time;
    std::chrono::steady_clock::time_point end_time;
};

std::string usage(const std::string& program_name) {
    return "chkr - verify files against MD5 digests\n\n"
           "Usage:\n"
           "  " + program_name + " file <file-path> <expected-checksum>\n"
           "  " + program_name + " manifest <checksum-path>\n"
           "  " + program_name + " (-h | --help)\n\n"
           "Exit status: 0 all matched, 1 mismatch, 2 error.\n\n"
           "Options:\n"
           "  -h --help              Show this screen\n"
           "  --quiet                Only report mismatches and errors\n"
           "  --status               Report nothing, exit status only\n"
           "  --verbose              Trace manifest resolution and hashing\n"
           "  --buffer-size <bytes>  Read buffer size for hashing\n";
}

bool parse_size(const std::string& s, size_t& out) {
    auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), out);
    return ec == std::errc() && ptr == s.data() + s.size() && out > 0;
}

void fail(FSMContext& ctx, std::string message) {
    ctx.exit_code = exit_code(Status::Error);
    ctx.error_message = std::move(message);
}

} // namespace

int run_cli(int argc, char** argv) {
    FSMState state = FSMState::Init;
    FSMContext ctx{argc, argv};
    while (state != FSMState::Done) {
        switch (state) {
            case FSMState::Init:
                ctx.start_time = std::chrono::steady_clock::now();
                compact::Writer::set_verbosity(compact::Verbosity::Normal);
                if (ctx.argc < 2) {
                    fail(ctx, "missing command.");
                    state = FSMState::Error;
                } else {
                    ctx.cmd = ctx.argv[1];
                    state = FSMState::ParseArgs;
                }
                break;
            case FSMState::ParseArgs: {
                if (ctx.cmd == "-h" || ctx.cmd == "--help") {
                    ctx.help = true;
                    state = FSMState::Error;
                    break;
                }
                state = FSMState::PreCommand;
                for (int i = 2; i < ctx.argc && state == FSMState::PreCommand; ++i) {
                    std::string a = ctx.argv[i];
                    if (a == "-h" || a == "--help") ctx.help = true;
                    else if (a == "--quiet") ctx.options.verbosity = compact::Verbosity::Quiet;
                    else if (a == "--status") ctx.options.verbosity = compact::Verbosity::Silent;
                    else if (a == "--verbose") ctx.options.verbosity = compact::Verbosity::Verbose;
                    else if (a == "--buffer-size") {
                        if (i + 1 >= ctx.argc || !parse_size(ctx.argv[++i], ctx.options.verify.read_buffer_size)) {
                            fail(ctx, "--buffer-size requires a positive byte count.");
                            state = FSMState::Error;
                        }
                    }
                    else ctx.args.push_back(a);
                }
                if (ctx.help) state = FSMState::Error;
                break;
            }
            case FSMState::PreCommand:
                if (ctx.cmd == "file") {
                    if (ctx.args.size() != 2) {
                        fail(ctx, "file requires <file-path> and <expected-checksum> arguments.");
                        state = FSMState::Error;
                        break;
                    }
                } else if (ctx.cmd == "manifest") {
                    if (ctx.args.size() != 1) {
                        fail(ctx, "manifest requires <checksum-path> argument.");
                        state = FSMState::Error;
                        break;
                    }
                } else {
                    fail(ctx, "Unknown command: " + ctx.cmd);
                    state = FSMState::Error;
                    break;
                }
                compact::Writer::set_verbosity(ctx.options.verbosity);
                compact::Writer::debug("[FSM] PreCommand checks passed for '" + ctx.cmd + "'\n");
                state = FSMState::RunCommand;
                break;
            case FSMState::RunCommand:
                if (ctx.cmd == "file") {
                    ctx.exit_code = cmd_file(ctx.args[0], ctx.args[1], ctx.options);
                } else {
                    ctx.exit_code = cmd_manifest(ctx.args[0], ctx.options);
                }
                state = FSMState::PostCommand;
                break;
            case FSMState::PostCommand:
                ctx.end_time = std::chrono::steady_clock::now();
                {
                    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(ctx.end_time - ctx.start_time).count();
                    compact::Writer::debug("[FSM] " + ctx.cmd + " finished in " + std::to_string(ms) + " ms\n");
                }
                state = FSMState::Done;
                break;
            case FSMState::Error: {
                std::string program = ctx.argc > 0 ? ctx.argv[0] : "chkr";
                if (ctx.help && ctx.error_message.empty()) {
                    compact::Writer::print(usage(program));
                } else {
                    compact::Writer::error("Error: " + ctx.error_message + "\n" + usage(program));
                }
                state = FSMState::Done;
                break;
            }
            case FSMState::Done:
                break;
        }
    }
    return ctx.exit_code;
}

} // namespace chkr
