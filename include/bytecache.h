#include "bytecache/detail/bucket.h"

#include "bytecache/history.h"
#include "bytecache/item.h"
#include "bytecache/measurement.h"
#include "bytecache/mem_cache.h"
#include "bytecache/path.h"
