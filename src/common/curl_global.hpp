#pragma once

namespace masterlist::net {

bool EnsureCurlGlobalInit();

} // namespace masterlist::net
