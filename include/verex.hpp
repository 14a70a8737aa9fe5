#pragma once

#include "verex/batch.hpp"
#include "verex/config.hpp"
#include "verex/dependencies.hpp"
#include "verex/discovery.hpp"
#include "verex/extract.hpp"
#include "verex/format.hpp"
#include "verex/heuristic.hpp"
#include "verex/isolate.hpp"
#include "verex/manifest.hpp"
#include "verex/utils.hpp"
#include "verex/verifier.hpp"
