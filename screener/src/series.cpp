#include "series.hpp"
#include <algorithm>

namespace {

template <typename Field>
Column extract(const std::vector<Bar>& bars, Field field) {
    Column out;
    out.reserve(bars.size());
    for (const auto& bar : bars) {
        out.push_back(bar.*field);
    }
    return out;
}

} // namespace

Column OhlcvSeries::closes() const { return extract(bars, &Bar::close); }
Column OhlcvSeries::highs() const { return extract(bars, &Bar::high); }
Column OhlcvSeries::lows() const { return extract(bars, &Bar::low); }
Column OhlcvSeries::volumes() const { return extract(bars, &Bar::volume); }

void OhlcvSeries::normalize() {
    std::stable_sort(bars.begin(), bars.end(),
                     [](const Bar& a, const Bar& b) { return a.date < b.date; });

    auto last = std::unique(bars.begin(), bars.end(),
                            [](const Bar& a, const Bar& b) { return a.date == b.date; });
    bars.erase(last, bars.end());
}
