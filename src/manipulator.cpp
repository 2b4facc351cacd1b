#include "argroute/manipulator.hpp"

#include <vector>

#include <spdlog/spdlog.h>

namespace argroute {

void ShortFlagSplitter::manipulate(TokenStream& stream) const {
    for (std::size_t i = 0; i < stream.size(); ++i) {
        const std::string token = stream.at(i);
        if (token == TokenStream::kEndOfOptions) return;
        if (!isCluster(token)) continue;

        std::vector<std::string> parts;
        parts.reserve(token.size() - 1);
        for (std::size_t pos = 1; pos < token.size(); ++pos) parts.push_back(std::string("-") + token[pos]);
        spdlog::trace("split \"{}\" into {} flags", token, parts.size());

        const std::size_t count = parts.size();
        stream.replace(i, std::move(parts));
        i += count - 1;
    }
}

} // namespace argroute
