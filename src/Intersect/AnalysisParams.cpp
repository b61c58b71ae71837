#include <QiTraffic/Intersect/AnalysisParams.h>
#include <QiTraffic/Core/Validate.h>
#include <QiTraffic/Platform/Thread.h>

namespace Qi::Traffic::Intersect {

AnalysisParams::AnalysisParams()
    : numWorkers(static_cast<int>(Platform::GetRecommendedThreadCount())) {
}

void AnalysisParams::Validate() const {
    Qi::Traffic::Validate::RequireAtLeast(numWorkers, 1, "numWorkers", "AnalysisParams");
}

const char* LineIntersectionStrategyName(LineIntersectionStrategy strategy) {
    switch (strategy) {
        case LineIntersectionStrategy::SmallestSegments: return "smallest-segments";
        case LineIntersectionStrategy::SplittingLine:    return "splitting-line";
    }
    return "unknown";
}

} // namespace Qi::Traffic::Intersect
