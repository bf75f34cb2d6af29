#pragma once

#include "weaver/analysis.hpp"
#include "weaver/config.hpp"
#include "weaver/error.hpp"
#include "weaver/format.hpp"
#include "weaver/position.hpp"
#include "weaver/report.hpp"
#include "weaver/run.hpp"
#include "weaver/snapshot.hpp"
#include "weaver/utils.hpp"
#include "weaver/weave.hpp"
