#pragma once

#include <string_view>

namespace digiplayer::command {

// Natural ordering: digit runs compare numerically, everything else
// byte-wise. "c2" < "c10", "9" < "10", "a" < "b".
// Returns <0, 0 or >0.
int CompareCommandIds(std::string_view lhs, std::string_view rhs);

// True when `candidate` should run given the persisted watermark.
// An empty watermark admits every non-empty id.
bool IsNewer(std::string_view candidate, std::string_view watermark);

} // namespace digiplayer::command
