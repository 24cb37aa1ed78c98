#include <atomic>
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <string>

#include "rarity/bindings/http.hpp"
#include "rarity/bindings/http_server.hpp"
#include "rarity/cache/cache_store.hpp"
#include "rarity/cache/fingerprint.hpp"
#include "rarity/cli/commands.hpp"
#include "rarity/cli/options.hpp"
#include "rarity/config/config.hpp"
#include "rarity/core/errors.hpp"
#include "rarity/net/fetcher.hpp"
#include "rarity/service/lookup.hpp"

// ========================================================================
// Global State
// ========================================================================

// Set while `serve` runs; the signal handler only performs an atomic store.
std::atomic<rarity::bindings::http::HttpServer*> g_server{nullptr};

// Cancels an in-flight `get` on SIGINT.
std::atomic<bool> g_cancel{false};

// ========================================================================
// Signal Handler
// ========================================================================

void stop_handler(int sig) {
    (void)sig;
    g_cancel.store(true);
    if (rarity::bindings::http::HttpServer* server = g_server.load()) {
        server->stop();
    }
}

// ========================================================================
// Error Handling
// ========================================================================

void print_error(const char* msg) {
    fprintf(stderr, "error: %s\n", msg);
}

void print_status_error(const char* context, rarity::core::Status s) {
    char desc[160];
    fprintf(stderr, "error: %s failed: %s (code=%s, domain=%s, aux=%u)\n",
            context,
            rarity::core::status_describe(s, desc, sizeof(desc)),
            rarity::core::status_code_name(s.code),
            rarity::core::status_domain_name(s.domain),
            s.aux);
}

void print_usage() {
    printf("Usage: raritymon [options] <command> [args]\n");
    printf("\n");
    printf("Commands:\n");
    printf("  serve                       Serve GET /api/{collection}/{id} over HTTP\n");
    printf("  get <collection> <id>       Look up one item and print its JSON\n");
    printf("  fingerprint <collection> <id>  Print the cache key for an item\n");
    printf("  help                        Show this help\n");
    printf("\n");
    printf("Options:\n");
    printf("  -d, --db <path>        Cache database file (env %s, default raritymon.db)\n", rarity::config::kEnvDbPath);
    printf("  -l, --listen <addr>    Listen address [host]:port (env %s, default :1337)\n", rarity::config::kEnvListen);
    printf("  -H, --host <host>      Source site host (env %s)\n", rarity::config::kEnvSourceHost);
    printf("  -t, --timeout <ms>     Page fetch timeout (env %s, default 10000)\n", rarity::config::kEnvFetchTimeout);
    printf("  -m, --max-age <secs>   Treat cache entries older than this as misses; 0 keeps them forever\n");
    printf("                         (env %s, default 0)\n", rarity::config::kEnvCacheMaxAge);
    printf("  -v, --verbose          Log cache hits and misses\n");
}

// ========================================================================
// Configuration
// ========================================================================

[[nodiscard]] bool apply_options(const rarity::cli::ParsedOptions& opts, rarity::config::AppConfig* cfg) {
    using rarity::cli::OptionId;

    for (rarity::core::u32 i = 0; i < opts.len; ++i) {
        const rarity::cli::ParsedOption& opt = opts.data[i];
        switch (opt.id) {
            case OptionId::Db:
                cfg->db_path = opt.value.str;
                break;
            case OptionId::Listen:
                cfg->listen_address = opt.value.str;
                break;
            case OptionId::Host:
                cfg->source_host = opt.value.str;
                break;
            case OptionId::Timeout:
                if (opt.value.i64v < 0 || opt.value.i64v > 0x7fffffff) {
                    print_error("--timeout must be between 0 and 2147483647");
                    return false;
                }
                cfg->fetch_timeout_ms = static_cast<rarity::core::u32>(opt.value.i64v);
                break;
            case OptionId::MaxAge:
                if (opt.value.i64v < 0) {
                    print_error("--max-age must not be negative");
                    return false;
                }
                cfg->cache_max_age_s = opt.value.i64v;
                break;
            case OptionId::Verbose:
                cfg->verbose = true;
                break;
            case OptionId::None:
                break;
        }
    }
    return true;
}

[[nodiscard]] bool parse_item_args(const rarity::cli::CliArgs& args, std::string* collection, rarity::core::u64* id) {
    if (args.argc != 2) {
        print_error("expected <collection> <id>");
        return false;
    }
    *collection = args.argv[0];
    if (collection->empty()) {
        print_error("collection must not be empty");
        return false;
    }
    if (!rarity::bindings::http::parse_item_id(args.argv[1], id)) {
        fprintf(stderr, "error: invalid item id: %s\n", args.argv[1]);
        return false;
    }
    return true;
}

// ========================================================================
// Command Handlers
// ========================================================================

int handle_fingerprint(const rarity::cli::CliArgs& args) {
    std::string collection;
    rarity::core::u64 id = 0;
    if (!parse_item_args(args, &collection, &id)) {
        return EXIT_FAILURE;
    }

    rarity::cache::Fingerprint key{};
    const rarity::core::Status s = rarity::cache::fingerprint(collection, id, &key);
    if (!rarity::core::is_ok(s)) {
        print_status_error("fingerprint", s);
        return EXIT_FAILURE;
    }
    printf("%s\n", rarity::cache::fingerprint_hex(key).c_str());
    return EXIT_SUCCESS;
}

int handle_get(const rarity::cli::CliArgs& args, rarity::service::ItemLookup& lookup) {
    std::string collection;
    rarity::core::u64 id = 0;
    if (!parse_item_args(args, &collection, &id)) {
        return EXIT_FAILURE;
    }

    rarity::service::LookupResult result;
    const rarity::core::Status s = lookup.lookup(collection, id, &result, &g_cancel);
    if (!rarity::core::is_ok(s)) {
        print_status_error("lookup", s);
        return EXIT_FAILURE;
    }
    printf("%s\n", result.json.c_str());
    return EXIT_SUCCESS;
}

int handle_serve(const rarity::config::AppConfig& cfg, rarity::service::ItemLookup& lookup) {
    rarity::bindings::http::ServerConfig server_cfg{};
    server_cfg.listen_address = cfg.listen_address;

    rarity::bindings::http::HttpServer server(lookup, server_cfg);
    rarity::core::Status s = server.listen();
    if (!rarity::core::is_ok(s)) {
        print_status_error("listen", s);
        return EXIT_FAILURE;
    }

    g_server.store(&server);
    s = server.run();
    g_server.store(nullptr);

    if (!rarity::core::is_ok(s)) {
        print_status_error("serve", s);
        return EXIT_FAILURE;
    }
    fprintf(stderr, "[serve] stopped\n");
    return EXIT_SUCCESS;
}

// ========================================================================
// Main
// ========================================================================

int main(int argc, char** argv) {
    std::signal(SIGINT, stop_handler);
    std::signal(SIGTERM, stop_handler);

    const rarity::cli::OptionSpec option_specs[] = {
        {rarity::cli::OptionId::Db, rarity::cli::OptionType::String, "db", 'd'},
        {rarity::cli::OptionId::Listen, rarity::cli::OptionType::String, "listen", 'l'},
        {rarity::cli::OptionId::Host, rarity::cli::OptionType::String, "host", 'H'},
        {rarity::cli::OptionId::Timeout, rarity::cli::OptionType::I64, "timeout", 't'},
        {rarity::cli::OptionId::MaxAge, rarity::cli::OptionType::I64, "max-age", 'm'},
        {rarity::cli::OptionId::Verbose, rarity::cli::OptionType::Flag, "verbose", 'v'},
    };
    const rarity::cli::CommandSpec command_specs[] = {
        {rarity::cli::CommandId::Help, "help"},
        {rarity::cli::CommandId::Serve, "serve"},
        {rarity::cli::CommandId::Get, "get"},
        {rarity::cli::CommandId::Fingerprint, "fingerprint"},
    };

    const rarity::cli::CliArgs all{argv + 1, argc > 0 ? static_cast<rarity::core::u32>(argc - 1) : 0u};

    rarity::cli::ParsedOption option_buf[32]{};
    rarity::cli::ParsedOptions opts{option_buf, 0, 32};
    rarity::core::u32 consumed = 0;
    rarity::core::Status s = rarity::cli::parse_options(all, option_specs,
                                                        sizeof(option_specs) / sizeof(option_specs[0]),
                                                        &opts, &consumed);
    if (!rarity::core::is_ok(s)) {
        print_error("invalid option (see `raritymon help`)");
        return EXIT_FAILURE;
    }

    const rarity::cli::CliArgs rest{all.argv + consumed, all.argc - consumed};
    if (rest.argc == 0) {
        print_usage();
        return EXIT_FAILURE;
    }

    rarity::cli::CommandInvocation cmd{};
    s = rarity::cli::parse_command(rest, command_specs,
                                   sizeof(command_specs) / sizeof(command_specs[0]),
                                   &cmd, &consumed);
    if (!rarity::core::is_ok(s)) {
        fprintf(stderr, "error: unknown command: %s\n", rest.argv[0]);
        print_usage();
        return EXIT_FAILURE;
    }

    if (cmd.id == rarity::cli::CommandId::Help) {
        print_usage();
        return EXIT_SUCCESS;
    }
    if (cmd.id == rarity::cli::CommandId::Fingerprint) {
        return handle_fingerprint(cmd.args);
    }

    // Defaults, then environment, then command line.
    rarity::config::AppConfig cfg{};
    s = rarity::config::load_from_env(&cfg);
    if (!rarity::core::is_ok(s)) {
        print_status_error("reading environment", s);
        return EXIT_FAILURE;
    }
    if (!apply_options(opts, &cfg)) {
        return EXIT_FAILURE;
    }

    rarity::cache::CacheConfig cache_cfg{};
    cache_cfg.path = cfg.db_path;
    cache_cfg.max_age_seconds = cfg.cache_max_age_s;

    rarity::cache::CacheStore store;
    s = store.open(cache_cfg);
    if (!rarity::core::is_ok(s)) {
        print_status_error("opening cache database", s);
        return EXIT_FAILURE;
    }

    rarity::net::CurlFetcher fetcher;
    rarity::service::LookupConfig lookup_cfg{};
    lookup_cfg.source_host = cfg.source_host;
    lookup_cfg.fetch_timeout_ms = cfg.fetch_timeout_ms;
    lookup_cfg.verbose = cfg.verbose;
    rarity::service::ItemLookup lookup(store, fetcher, lookup_cfg);

    int rc = EXIT_FAILURE;
    if (cmd.id == rarity::cli::CommandId::Serve) {
        rc = handle_serve(cfg, lookup);
    } else if (cmd.id == rarity::cli::CommandId::Get) {
        rc = handle_get(cmd.args, lookup);
    }

    s = store.close();
    if (!rarity::core::is_ok(s)) {
        print_status_error("closing cache database", s);
        return EXIT_FAILURE;
    }
    return rc;
}
