#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <string>
#include <vector>

#include "etfcast/cli/commands.hpp"
#include "etfcast/cli/input.hpp"
#include "etfcast/cli/options.hpp"
#include "etfcast/core/config.hpp"
#include "etfcast/core/errors.hpp"
#include "etfcast/etfcast.hpp"

namespace {
    void print_usage() {
        std::printf("usage: etfcat <command> [options]\n");
        std::printf("\n");
        std::printf("Commands:\n");
        std::printf("  dump    Decode one ETF value and print it\n");
        std::printf("  check   Decode one ETF value and print ok or the error\n");
        std::printf("  help    Show this text\n");
        std::printf("\n");
        std::printf("Options:\n");
        std::printf("  -f, --file FILE        Read FILE instead of stdin\n");
        std::printf("  -x, --hex              Input is hex text (\"83 61 05\")\n");
        std::printf("  -d, --max-depth N      Nesting limit (default %u)\n", etfcast::core::kDefaultMaxDepth);
        std::printf("      --omit-list-tail   Lists carry no trailing nil\n");
        std::printf("  -v, --verbose          Trace decode failures\n");
        std::printf("\n");
        std::printf("Environment: ETFCAST_MAX_DEPTH, ETFCAST_LIST_TAIL=required|omitted, ETFCAST_TRACE=0|1\n");
    }

    void print_status_error(const char* context, etfcast::core::Status s) {
        std::fprintf(stderr, "error: %s failed (%s/%s, aux=%u)\n", context,
                     etfcast::core::status_domain_name(s.domain), etfcast::core::status_code_name(s.code), s.aux);
        if (s.code == etfcast::core::StatusCode::Io && s.aux != 0) {
            std::fprintf(stderr, "error: %s: %s\n", context, std::strerror(static_cast<int>(s.aux)));
        }
    }

    int run_decode(etfcast::cli::CommandId command, const etfcast::cli::CliArgs& args) {
        etfcast::cli::u32 spec_count = 0;
        const etfcast::cli::OptionSpec* specs = etfcast::cli::etfcat_options(&spec_count);

        etfcast::cli::ParsedOption buf[16]{};
        etfcast::cli::ParsedOptions parsed{buf, 0, 16};
        etfcast::cli::u32 consumed = 0;
        etfcast::core::Status s = etfcast::cli::parse_options(args, specs, spec_count, &parsed, &consumed);
        if (!etfcast::core::is_ok(s)) {
            std::fprintf(stderr, "error: invalid options; see 'etfcat help'\n");
            return EXIT_FAILURE;
        }
        if (consumed < args.argc) {
            std::fprintf(stderr, "error: unexpected argument %s\n", args.argv[consumed]);
            return EXIT_FAILURE;
        }

        // Environment first, flags on top.
        etfcast::core::DecoderConfig cfg{};
        s = etfcast::core::decoder_config_from_env(&cfg);
        if (!etfcast::core::is_ok(s)) {
            std::fprintf(stderr, "error: invalid ETFCAST_* environment variable\n");
            return EXIT_FAILURE;
        }
        etfcast::cli::InputOptions input{};
        s = etfcast::cli::apply_options(parsed, &cfg, &input);
        if (!etfcast::core::is_ok(s)) {
            std::fprintf(stderr, "error: --max-depth must be a positive integer\n");
            return EXIT_FAILURE;
        }

        std::vector<etfcast::core::u8> bytes;
        s = etfcast::cli::read_input(input.path, &bytes);
        if (!etfcast::core::is_ok(s)) {
            print_status_error("read input", s);
            return EXIT_FAILURE;
        }
        if (input.hex) {
            const std::string text(bytes.begin(), bytes.end());
            s = etfcast::cli::decode_hex(text, &bytes);
            if (!etfcast::core::is_ok(s)) {
                std::fprintf(stderr, "error: malformed hex input near offset %u\n", s.aux);
                return EXIT_FAILURE;
            }
        }
        if (input.verbose) {
            std::fprintf(stderr, "etfcat: %zu bytes, max_depth=%u, list_tail=%s\n", bytes.size(), cfg.max_depth,
                         cfg.list_tail == etfcast::core::ListTail::Required ? "required" : "omitted");
        }

        etfcast::wire::Term term;
        etfcast::core::ErrorDetail detail;
        const etfcast::core::BufferView view{bytes.data(), static_cast<etfcast::core::u32>(bytes.size())};
        s = etfcast::unpack_term(view, &term, cfg, &detail);
        if (!etfcast::core::is_ok(s)) {
            std::fprintf(stderr, "error: %s\n", etfcast::core::format_error(detail).c_str());
            return EXIT_FAILURE;
        }

        if (command == etfcast::cli::CommandId::Check) {
            std::printf("ok\n");
        } else {
            std::printf("%s\n", etfcast::wire::format_term(term).c_str());
        }
        return EXIT_SUCCESS;
    }
} // namespace

int main(int argc, char** argv) {
    const etfcast::cli::CommandSpec commands[] = {
        {etfcast::cli::CommandId::Help, "help"},
        {etfcast::cli::CommandId::Dump, "dump"},
        {etfcast::cli::CommandId::Check, "check"},
    };
    const etfcast::cli::u32 command_count = sizeof(commands) / sizeof(commands[0]);

    if (argc < 2) {
        print_usage();
        return EXIT_FAILURE;
    }

    const etfcast::cli::CliArgs args{argv + 1, static_cast<etfcast::cli::u32>(argc - 1)};
    etfcast::cli::CommandInvocation inv{};
    etfcast::cli::u32 consumed = 0;
    const etfcast::core::Status s = etfcast::cli::parse_command(args, commands, command_count, &inv, &consumed);
    if (!etfcast::core::is_ok(s)) {
        std::fprintf(stderr, "error: unknown command %s\n", argv[1]);
        print_usage();
        return EXIT_FAILURE;
    }

    switch (inv.id) {
    case etfcast::cli::CommandId::Help:
        print_usage();
        return EXIT_SUCCESS;
    case etfcast::cli::CommandId::Dump:
    case etfcast::cli::CommandId::Check:
        return run_decode(inv.id, inv.args);
    case etfcast::cli::CommandId::None:
        break;
    }
    return EXIT_FAILURE;
}
