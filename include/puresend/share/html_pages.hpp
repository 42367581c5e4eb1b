#pragma once

#include <cstdint>
#include <string>

// Static pages served to browsers by the share and web upload servers.
namespace puresend::share::pages {

std::string share_files();
std::string share_pin();
std::string share_locked(std::uint64_t remaining_seconds);

std::string upload_form(std::uint32_t chunk_size);

// Polls /request-status and reloads once the host has decided.
std::string waiting();
std::string rejected();
std::string message(const std::string& title, const std::string& text);

} // namespace puresend::share::pages
