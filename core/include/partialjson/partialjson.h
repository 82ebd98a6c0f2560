#pragma once

// Umbrella header for hosts that serialize partial JSON responses.

#include "partialjson/errors.h"
#include "partialjson/executor.h"
#include "partialjson/fields_parser.h"
#include "partialjson/json_filter.h"
#include "partialjson/selection.h"
