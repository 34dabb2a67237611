#pragma once

#include "config.hpp"
#include "diagnostics.hpp"
#include "element.hpp"
#include "engine.hpp"
#include "facts.hpp"
#include "format.hpp"
#include "report.hpp"
#include "schema.hpp"
#include "sections.hpp"
#include "synthesizer.hpp"
#include "tree.hpp"
#include "utils.hpp"
#include "validator.hpp"
