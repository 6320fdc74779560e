#pragma once

#ifndef TAGCACHE_VERSION
#define TAGCACHE_VERSION "1.0.0"
#endif

namespace tagcache {
class cache_provider;
}

// argv[0] is the program; options come before the command
int cli_dispatch(int argc, char** argv);

// Commands run against an open provider; argv[0] is the command name
int cli_run(tagcache::cache_provider& cache, int argc, char** argv);

void cli_usage();
