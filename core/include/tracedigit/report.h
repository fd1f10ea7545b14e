#pragma once

/// \file report.h
/// \brief Tabular (CSV) and structured (JSON) renderings of a DigitizeResult.

#include "digitize.h"

#include <string>

namespace TraceDigit {

/// One line per sample:
/// `Cycle #,Y Position (pixels),Converted Y Position (<bottom>-<top> scale)`.
std::string SamplesToCsv(const DigitizeResult& result);

/// `Statistic,Value` table with `Mean` and `Std` rows. NaN renders as an
/// empty cell.
std::string SummaryToCsv(const SummaryStats& summary);

/// Full result document: status, image size, profile statistics, peaks,
/// boundaries, landmarks, samples and summary.
std::string ResultToJsonString(const DigitizeResult& result, int indent = 4);

/// Writes \p content to \p path. Throws IOError on failure.
void WriteTextFile(const std::string& path, const std::string& content);

} // namespace TraceDigit
