#include "serve/mime-mappings.hpp"

#include <algorithm>
#include <cstddef>
#include <iterator>
#include <string_view>

#include "serve/toupperlower.hpp"

namespace serve {

static_assert(std::ranges::is_sorted(kMIMEMappings, {}, &MIMEMapping::extension),
              "kMIMEMappings must be sorted by extension");

const MIMEMapping* DetermineMIMEMapping(std::string_view path) noexcept {
  static constexpr std::size_t kMaxExtensionSize =
      std::ranges::max_element(kMIMEMappings, {}, [](const MIMEMapping& mapping) {
        return mapping.extension.size();
      })->extension.size();

  const auto dotPos = path.rfind('.');
  if (dotPos == std::string_view::npos || path.find('/', dotPos) != std::string_view::npos) {
    return nullptr;
  }
  const std::size_t extSize = path.size() - dotPos - 1U;
  if (extSize == 0 || extSize > kMaxExtensionSize) {
    return nullptr;
  }

  char extBuf[kMaxExtensionSize];
  const auto endIt = std::transform(path.begin() + static_cast<std::ptrdiff_t>(dotPos) + 1, path.end(), extBuf,
                                    [](char ch) { return tolower(ch); });
  const std::string_view ext(extBuf, endIt);

  const auto it = std::ranges::lower_bound(kMIMEMappings, ext, {}, &MIMEMapping::extension);
  if (it != std::end(kMIMEMappings) && it->extension == ext) {
    return &*it;
  }
  return nullptr;
}

std::string_view DetermineMIMETypeStr(std::string_view path) noexcept {
  const MIMEMapping* mapping = DetermineMIMEMapping(path);
  return mapping == nullptr ? kDefaultMIMEType : mapping->mimeType;
}

}  // namespace serve
