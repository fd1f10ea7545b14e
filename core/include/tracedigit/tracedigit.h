#pragma once

/// \file tracedigit.h
/// \brief Umbrella header including every public TraceDigit header.

#include "tracedigit/version.h"
#include "export.h"
#include "error.h"
#include "common.h"
#include "config.h"
#include "profile.h"
#include "peaks.h"
#include "segment.h"
#include "landmark.h"
#include "calibration.h"
#include "digitize.h"
#include "imgproc.h"
#include "annotate.h"
#include "encoding.h"
#include "report.h"
#include "pipeline.h"
#include "synthetic.h"
#include "logging.h"
