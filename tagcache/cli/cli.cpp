#include "cli.h"
#include <iostream>
#include <string>
#include <string_view>
#include <vector>

#include <tagcache/cache_provider.h>
#include "../shared/command_hashing.h"
#include "../shared/config.h"

using namespace tagcache;

namespace {

std::vector<std::string> collect(int argc, char** argv, int from)
{
    std::vector<std::string> out;
    for (int i = from; i < argc; ++i)
        out.emplace_back(argv[i]);
    return out;
}

const char* kind_name(entry_kind kind)
{
    switch (kind)
    {
        case entry_hash_field:        return "hash";
        case entry_set_member:        return "set";
        case entry_sorted_set_member: return "zset";
        default:                      return "string";
    }
}

bool need_args(int argc, int n, const char* usage)
{
    if (argc >= n)
        return true;
    std::cerr << "usage: tagcache-cli " << usage << "\n";
    return false;
}

} // namespace

void cli_usage()
{
    std::cerr <<
        "tagcache-cli " TAGCACHE_VERSION "\n"
        "usage: tagcache-cli [--config <file.lua>] <command> [args]\n"
        "\n"
        "commands:\n"
        "  ping                      check the store connection\n"
        "  keys <pattern>            list keys matching a glob pattern\n"
        "  get <key>                 print a string value\n"
        "  del <key>...              remove keys\n"
        "  ttl <key>                 remaining time to live in ms (-1 = none)\n"
        "  fields <key> [pattern]    list hash fields\n"
        "  tags                      list tag names\n"
        "  tagged <tag>...           list live entries of the tags\n"
        "  in-tag <key> <tag>...     check whether a key carries any of the tags\n"
        "  invalidate <tag>...       remove every entry of the tags\n"
        "  flush                     remove everything\n";
}

int cli_run(cache_provider& cache, int argc, char** argv)
{
    std::string_view cmd = argv[0];

    switch (fnv1a(cmd))
    {
        case fnv1a("ping"):
        {
            if (!cache.client().ping())
            {
                std::cerr << "no reply\n";
                return 2;
            }
            std::cout << "PONG\n";
            return 0;
        }
        case fnv1a("keys"):
        {
            if (!need_args(argc, 2, "keys <pattern>"))
                return 1;
            for (const auto& key : cache.get_keys_by_pattern(argv[1]))
                std::cout << key << "\n";
            return 0;
        }
        case fnv1a("get"):
        {
            if (!need_args(argc, 2, "get <key>"))
                return 1;
            std::string value;
            if (!cache.try_get_object(argv[1], value))
            {
                std::cout << "(nil)\n";
                return 0;
            }
            std::cout << value << "\n";
            return 0;
        }
        case fnv1a("del"):
        {
            if (!need_args(argc, 2, "del <key>..."))
                return 1;
            std::cout << cache.remove(collect(argc, argv, 1)) << "\n";
            return 0;
        }
        case fnv1a("ttl"):
        {
            if (!need_args(argc, 2, "ttl <key>"))
                return 1;
            auto ttl = cache.key_time_to_live(argv[1]);
            std::cout << (ttl ? ttl->count() : -1) << "\n";
            return 0;
        }
        case fnv1a("fields"):
        {
            if (!need_args(argc, 2, "fields <key> [pattern]"))
                return 1;
            std::string pattern = argc > 2 ? argv[2] : "*";
            for (const auto& [field, value] : cache.scan_hashed<std::string>(argv[1], pattern))
                std::cout << field << "=" << value << "\n";
            return 0;
        }
        case fnv1a("tags"):
        {
            for (const auto& tag : cache.get_all_tags())
                std::cout << tag << "\n";
            return 0;
        }
        case fnv1a("tagged"):
        {
            if (!need_args(argc, 2, "tagged <tag>..."))
                return 1;
            for (const auto& entry : cache.get_tagged_entries(collect(argc, argv, 1)))
            {
                std::cout << kind_name(entry.kind) << " " << entry.key;
                if (entry.kind != entry_string)
                    std::cout << " " << entry.field;
                std::cout << "\n";
            }
            return 0;
        }
        case fnv1a("in-tag"):
        {
            if (!need_args(argc, 3, "in-tag <key> <tag>..."))
                return 1;
            bool member = cache.is_string_key_in_tag(argv[1], collect(argc, argv, 2));
            std::cout << (member ? "true" : "false") << "\n";
            return 0;
        }
        case fnv1a("invalidate"):
        {
            if (!need_args(argc, 2, "invalidate <tag>..."))
                return 1;
            std::cout << cache.invalidate_tags(collect(argc, argv, 1)) << "\n";
            return 0;
        }
        case fnv1a("flush"):
            cache.flush_all();
            std::cout << "OK\n";
            return 0;
        default:
            std::cerr << "unknown command: " << cmd << "\n";
            cli_usage();
            return 1;
    }
}

int cli_dispatch(int argc, char** argv)
{
    store_config config;
    int i = 1;

    for (; i < argc; ++i)
    {
        std::string_view arg = argv[i];
        if (arg.empty() || arg[0] != '-')
            break;

        switch (fnv1a(arg))
        {
            case fnv1a("--config"):
            case fnv1a("-c"):
            {
                if (i + 1 >= argc)
                {
                    std::cerr << "--config needs a file\n";
                    return 1;
                }
                std::string error;
                if (!load_config(argv[++i], config, error))
                {
                    std::cerr << error << "\n";
                    return 1;
                }
                break;
            }
            case fnv1a("--help"):
            case fnv1a("-h"):
                cli_usage();
                return 0;
            case fnv1a("--version"):
                std::cout << "tagcache-cli " TAGCACHE_VERSION "\n";
                return 0;
            default:
                std::cerr << "unknown option: " << arg << "\n";
                return 1;
        }
    }

    if (i >= argc)
    {
        cli_usage();
        return 1;
    }

    logger::g_level = config.level;

    try
    {
        cache_provider cache(make_pool(config), make_provider_options(config));
        return cli_run(cache, argc - i, argv + i);
    }
    catch (const serialization_error& e)
    {
        std::cerr << "serialization error: " << e.what() << "\n";
        return 2;
    }
    catch (const store_error& e)
    {
        std::cerr << "store error: " << e.what() << "\n";
        return 2;
    }
}
