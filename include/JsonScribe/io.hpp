#pragma once

#include <iterator>

namespace JsonScribe {

// 1) Iterator you can:
//    - write as *it   (convertible to char)
//    - advance as it++ / ++it
template <class It>
concept CharOutputIterator =
    std::output_iterator<It, char>;

// 2) Matching "end" type you can:
//    - compare as it == end / it != end
template <class Sent, class It>
concept CharSentinelForOut =
    std::sentinel_for<Sent, It>;

namespace io_details {

// End marker for outputs that never run out of room (back inserters, stream iterators).
struct limitless_sentinel {
    template <class It>
    friend constexpr bool operator==(const It&, const limitless_sentinel&) noexcept {
        return false;
    }
};

} // namespace io_details

} // namespace JsonScribe
