// SPDX-License-Identifier: MIT
// yapb - Main header for the yapb indicator library
//
// Include this single header to access all public yapb APIs.
// For more granular control, include individual headers instead.

#pragma once

// Version info
#include <yapb/version.h>

// Glyphs - code point tables and encoding helpers
#include <yapb/glyph/braille.h>           // brailleBinary()
#include <yapb/glyph/tables.h>            // Block element and braille tables
#include <yapb/glyph/utf8.h>              // appendUtf8()

// Indicators - stateful, rendered on demand
#include <yapb/indicator/indicator.h>     // Indicator, RenderOptions, operator<<
#include <yapb/indicator/bar.h>           // Bar
#include <yapb/indicator/spinner.h>       // Spinner4/8, Counter16/256, Snake

// Numbers - pure formatting helpers
#include <yapb/number/prefix.h>           // binary(), si()
#include <yapb/number/sigfigs.h>          // SigFigs, formatSigFigs()
#include <yapb/number/compact.h>          // Binary, Scientific
#include <yapb/number/moving_average.h>   // MovingAverage
