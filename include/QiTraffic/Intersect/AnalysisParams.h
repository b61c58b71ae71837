#pragma once

/**
 * @file AnalysisParams.h
 * @brief Parameters of an event creation run
 */

#include <QiTraffic/Core/Export.h>
#include <QiTraffic/Platform/Log.h>

namespace Qi::Traffic::Intersect {

/**
 * @brief Algorithm used for line sections
 */
enum class LineIntersectionStrategy {
    SmallestSegments,   ///< One event per crossing segment (default)
    SplittingLine       ///< One event per split point of the track polyline
};

/**
 * @brief Event creation parameters
 *
 * @code
 * AnalysisParams params;
 * params.numWorkers = 4;
 * params.lineStrategy = LineIntersectionStrategy::SplittingLine;
 * params.Validate();
 * @endcode
 */
struct QITRAFFIC_API AnalysisParams {
    int numWorkers;                     ///< Worker threads (>= 1)
    LineIntersectionStrategy lineStrategy = LineIntersectionStrategy::SmallestSegments;
    bool parallel = true;               ///< false: run tracks sequentially
    Platform::LogLevel logLevel = Platform::LogLevel::Info;

    /// numWorkers defaults to Platform::GetRecommendedThreadCount()
    AnalysisParams();

    /// @throws InvalidArgumentException if numWorkers < 1
    void Validate() const;
};

QITRAFFIC_API const char* LineIntersectionStrategyName(LineIntersectionStrategy strategy);

} // namespace Qi::Traffic::Intersect
