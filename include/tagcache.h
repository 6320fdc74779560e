// tagcache.h — Umbrella header
#pragma once

#include <tagcache/types.h>
#include <tagcache/value_codec.h>
#include <tagcache/cache_provider.h>
#include "tagcache/shared/config.h"
