#pragma once

// Every value type shared between the core services, the HTTP routes and the CLI
#include "sage_core/types/chunk.hpp"
#include "sage_core/types/file.hpp"
#include "sage_core/types/search.hpp"
