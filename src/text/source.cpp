#include "prose/text/source.hpp"

#include "prose/log/log.hpp"

#include <cerrno>
#include <fstream>
#include <sstream>

namespace prose {

auto Source::from_str(std::string_view text) -> Source {
    Source source;
    source.text_ = IndexedString::from_str(text);
    return source;
}

auto Source::from_file(const std::filesystem::path& path) -> Result<Source, std::error_code> {
    std::error_code ec;
    if (std::filesystem::is_directory(path, ec)) {
        return std::make_error_code(std::errc::is_a_directory);
    }

    errno = 0;
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        int err = errno != 0 ? errno : ENOENT;
        PROSE_LOG_DEBUG("source", "cannot open " << path.string() << ": "
                                                 << std::generic_category().message(err));
        return std::error_code(err, std::generic_category());
    }

    std::ostringstream buffer;
    buffer << file.rdbuf();
    if (file.bad()) {
        return std::make_error_code(std::errc::io_error);
    }

    std::string content = buffer.str();
    if (!is_valid_utf8(content)) {
        PROSE_LOG_DEBUG("source", path.string() << " is not valid UTF-8");
        return std::make_error_code(std::errc::illegal_byte_sequence);
    }

    Source source = from_str(content);
    source.path_ = path;
    PROSE_LOG_DEBUG("source", "loaded " << path.string() << " (" << source.byte_len()
                                        << " bytes, " << source.len() << " chars)");
    return source;
}

} // namespace prose
