#ifndef GHDIGEST_VERSION_HPP
#define GHDIGEST_VERSION_HPP

namespace ghd {

/// Release version reported by `--version` and the mail User-Agent.
inline constexpr const char *kVersionString = "0.1.0";

} // namespace ghd

#endif // GHDIGEST_VERSION_HPP
