#include <LogParser.hpp>
#include <string_view>

void split_on_marker(std::string_view line, std::string_view marker,
                     SplitResult &out) {
  out.post.clear();
  out.marker_count = 0;

  size_t pos = line.find(marker);
  if (pos == std::string_view::npos) {
    out.pre = line;
    return;
  }
  out.pre = line.substr(0, pos);
  while (pos != std::string_view::npos) {
    ++out.marker_count;
    size_t start = pos + marker.size();
    size_t next = line.find(marker, start);
    out.post.emplace_back(line.substr(
        start, next == std::string_view::npos ? std::string_view::npos
                                              : next - start));
    pos = next;
  }
}

size_t count_marker(std::string_view line, std::string_view marker) {
  size_t count = 0;
  for (size_t pos = line.find(marker); pos != std::string_view::npos;
       pos = line.find(marker, pos + marker.size()))
    ++count;
  return count;
}
