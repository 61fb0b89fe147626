#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

struct ListingEntry {
  std::string name;
  std::string href;     // already percent-encoded
  bool is_directory = false;
  std::uint64_t size = 0;
};

std::string html_escape(std::string_view text);
std::string format_size(std::uint64_t bytes);

// `upload_action` empty: no upload form on the page.
std::string render_listing_page(std::string_view title,
                                const std::vector<ListingEntry>& entries,
                                std::string_view parent_href,
                                std::string_view upload_action);
std::string render_paste_page(bool already_received);
std::string render_ok_page(const std::vector<std::string>& details = {});
std::string render_error_page(int status, std::string_view message);
