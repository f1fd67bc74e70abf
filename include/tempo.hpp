#pragma once

#include "tempo/config.hpp"
#include "tempo/errors.hpp"
#include "tempo/format.hpp"
#include "tempo/glob.hpp"
#include "tempo/host.hpp"
#include "tempo/logger.hpp"
#include "tempo/reporter.hpp"
#include "tempo/result.hpp"
#include "tempo/stats.hpp"
#include "tempo/summary.hpp"
#include "tempo/table.hpp"
#include "tempo/toolchain.hpp"
#include "tempo/tools.hpp"
#include "tempo/units.hpp"
#include "tempo/utils.hpp"
