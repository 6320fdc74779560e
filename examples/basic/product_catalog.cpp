// tagcache — cache-aside product lookups with tag invalidation
//
// Build: cmake -S . -B build && cmake --build build --target product_catalog
// Run:   ./build/product_catalog            (in-process memory store)
//        ./build/product_catalog redis.lua  (store from a config script)

#include <tagcache.h>
#include <iostream>

using namespace tagcache;
using namespace std::chrono_literals;

namespace {

std::vector<std::string> load_products(const std::string& category)
{
    std::cout << "  (loading " << category << " from the database)\n";
    if (category == "fruit")
        return {"apple", "pear", "plum"};
    return {"hammer", "saw"};
}

} // namespace

int main(int argc, char** argv)
{
    store_config config;
    config.backend = backend_memory;
    if (argc > 1)
    {
        std::string error;
        if (!load_config(argv[1], config, error))
        {
            std::cerr << error << "\n";
            return 1;
        }
    }

    try
    {
        cache_provider cache(make_pool(config), make_provider_options(config));
        auto tags_for = [](const std::string& category)
        {
            return with_tags({"catalog", "category:" + category});
        };

        for (const char* category : {"fruit", "tools", "fruit"})
        {
            auto products = cache.fetch_object("products:" + std::string(category),
                                               [&] { return load_products(category); },
                                               tags_for(category), 10min);
            std::cout << category << ": " << products.size() << " products\n";
        }

        std::cout << "invalidated " << cache.invalidate_tags({"category:fruit"}) << " entries\n";
        cache.fetch_object("products:fruit", [] { return load_products("fruit"); }, tags_for("fruit"));

        for (const auto& key : cache.get_keys_by_tag({"catalog"}))
            std::cout << "tagged: " << key << "\n";
    }
    catch (const cache_error& e)
    {
        std::cerr << "cache error: " << e.what() << "\n";
        return 2;
    }
    return 0;
}
