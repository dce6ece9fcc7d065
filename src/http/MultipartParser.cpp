#include "http/MultipartParser.hpp"
#include "http/HttpError.hpp"
#include <cctype>
#include <algorithm>

namespace lanshare {
namespace http {

void MultipartStreamParser::trim(std::string& s) {
    size_t start = 0;
    size_t end = s.size();
    while (start < end && (s[start] == ' ' || s[start] == '\t')) ++start;
    while (end > start && (s[end - 1] == ' ' || s[end - 1] == '\t' ||
                            s[end - 1] == '\r' || s[end - 1] == '\n')) --end;
    s = s.substr(start, end - start);
}

void MultipartStreamParser::toLower(std::string& s) {
    for (char& c : s) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
}

void MultipartStreamParser::parseContentDisposition(const std::string& value,
                                                    std::string& name,
                                                    std::string& filename) {
    // Split on ';' outside of quoted strings so filenames may contain ';'
    std::string token;
    bool quoted = false;
    auto flush = [&]() {
        trim(token);
        auto eq = token.find('=');
        if (!token.empty() && eq != std::string::npos) {
            std::string key = token.substr(0, eq);
            std::string val = token.substr(eq + 1);
            trim(key);
            trim(val);
            toLower(key);

            // Remove surrounding quotes and unescape
            if (val.size() >= 2 && val.front() == '"' && val.back() == '"') {
                std::string raw = val.substr(1, val.size() - 2);
                val.clear();
                for (size_t i = 0; i < raw.size(); ++i) {
                    if (raw[i] == '\\' && i + 1 < raw.size()) ++i;
                    val += raw[i];
                }
            }

            if (key == "name") {
                name = val;
            } else if (key == "filename") {
                filename = val;
            }
        }
        token.clear();
    };

    for (size_t i = 0; i < value.size(); ++i) {
        char c = value[i];
        if (c == '"') {
            quoted = !quoted;
        } else if (c == '\\' && quoted && i + 1 < value.size()) {
            token += c;
            c = value[++i];
        } else if (c == ';' && !quoted) {
            flush();
            continue;
        }
        token += c;
    }
    flush();
}

std::string MultipartStreamParser::extractBoundary(const std::string& content_type) {
    std::string boundary;

    auto semicolon = content_type.find(';');
    if (semicolon == std::string::npos) {
        return boundary;
    }

    std::string params = content_type.substr(semicolon + 1);

    while (!params.empty()) {
        auto next_semi = params.find(';');
        std::string token = (next_semi == std::string::npos) ? params : params.substr(0, next_semi);
        params = (next_semi == std::string::npos) ? "" : params.substr(next_semi + 1);

        trim(token);
        if (token.empty()) continue;

        auto eq = token.find('=');
        if (eq == std::string::npos) continue;

        std::string key = token.substr(0, eq);
        std::string val = token.substr(eq + 1);
        trim(key);
        trim(val);
        toLower(key);

        if (val.size() >= 2 && val.front() == '"' && val.back() == '"') {
            val = val.substr(1, val.size() - 2);
        }

        if (key == "boundary") {
            boundary = val;
            break;
        }
    }

    return boundary;
}

PartHeaders MultipartStreamParser::parseHeaderBlock(const std::string& block) {
    PartHeaders part;

    size_t hpos = 0;
    while (hpos < block.size()) {
        size_t eol = block.find("\r\n", hpos);
        if (eol == std::string::npos) eol = block.size();

        std::string hline = block.substr(hpos, eol - hpos);
        hpos = eol + 2;

        auto colon = hline.find(':');
        if (colon == std::string::npos) continue;

        std::string hname = hline.substr(0, colon);
        std::string hvalue = hline.substr(colon + 1);
        trim(hname);
        trim(hvalue);
        toLower(hname);

        if (hname == "content-disposition") {
            parseContentDisposition(hvalue, part.name, part.filename);
        } else if (hname == "content-type") {
            part.content_type = hvalue;
        }
    }

    return part;
}

MultipartStreamParser::MultipartStreamParser(const std::string& boundary, MultipartHandler& handler,
                                             size_t maxHeaderBlock, size_t maxFieldValue)
    : marker_("--" + boundary),
      delimiter_("\r\n--" + boundary),
      safetyTail_(marker_.size() + 10),
      maxHeaderBlock_(maxHeaderBlock),
      maxFieldValue_(maxFieldValue),
      handler_(handler),
      state_(SeekingPart{}) {
    if (boundary.empty()) {
        throw HttpError::malformed("No boundary in content type");
    }
}

const char* MultipartStreamParser::stateName() const {
    switch (state_.index()) {
        case 0: return "SeekingPart";
        case 1: return "ReadingHeaders";
        case 2: return "ReadingFieldValue";
        case 3: return "ReadingFileData";
        case 4: return "SkippingPart";
        case 5: return "Done";
    }
    return "Unknown";
}

void MultipartStreamParser::feed(const char* data, size_t len) {
    // Epilogue after the closing delimiter is ignored
    if (done()) return;

    buffer_.append(data, len);
    while (std::visit([this](auto& s) { return step(s); }, state_)) {
    }
}

void MultipartStreamParser::finish() {
    if (std::holds_alternative<Done>(state_) || std::holds_alternative<SeekingPart>(state_)) {
        buffer_.clear();
        state_ = Done{};
        return;
    }
    throw HttpError::incomplete(std::string("Multipart body ended while in ") + stateName());
}

bool MultipartStreamParser::step(SeekingPart&) {
    size_t pos = buffer_.find(marker_);
    if (pos == std::string::npos) {
        // Keep just enough to recognise a marker split across chunks
        size_t keep = marker_.size() - 1;
        if (buffer_.size() > keep) {
            buffer_.erase(0, buffer_.size() - keep);
        }
        return false;
    }

    size_t after = pos + marker_.size();
    if (buffer_.size() < after + 2) {
        buffer_.erase(0, pos);
        return false;
    }

    if (buffer_.compare(after, 2, "--") == 0) {
        buffer_.clear();
        state_ = Done{};
        return false;
    }

    if (buffer_.compare(after, 2, "\r\n") == 0) after += 2;
    buffer_.erase(0, after);
    state_ = ReadingHeaders{};
    return true;
}

bool MultipartStreamParser::step(ReadingHeaders&) {
    if (buffer_.size() < 2) return false;

    std::string block;
    if (buffer_.compare(0, 2, "\r\n") == 0) {
        buffer_.erase(0, 2);
    } else {
        size_t end = buffer_.find("\r\n\r\n");
        if (end == std::string::npos) {
            if (buffer_.size() > maxHeaderBlock_) {
                throw HttpError::malformed("Part header block too large");
            }
            return false;
        }
        block = buffer_.substr(0, end);
        buffer_.erase(0, end + 4);
    }

    PartHeaders headers = parseHeaderBlock(block);
    switch (handler_.onPartHeaders(headers)) {
        case PartDisposition::Field:
            state_ = ReadingFieldValue{std::move(headers)};
            break;
        case PartDisposition::File:
            state_ = ReadingFileData{std::move(headers), 0};
            break;
        case PartDisposition::Skip:
            state_ = SkippingPart{};
            break;
    }
    return true;
}

bool MultipartStreamParser::step(ReadingFieldValue& s) {
    size_t pos = buffer_.find(delimiter_);
    if (pos == std::string::npos) {
        if (buffer_.size() > maxFieldValue_ + delimiter_.size()) {
            throw HttpError::malformed("Form field '" + s.headers.name + "' too large");
        }
        return false;
    }
    if (pos > maxFieldValue_) {
        throw HttpError::malformed("Form field '" + s.headers.name + "' too large");
    }

    handler_.onFieldValue(s.headers, buffer_.substr(0, pos));
    // Leave "--boundary" in place for SeekingPart
    buffer_.erase(0, pos + 2);
    state_ = SeekingPart{};
    return true;
}

bool MultipartStreamParser::step(ReadingFileData& s) {
    size_t pos = buffer_.find(delimiter_);
    if (pos == std::string::npos) {
        if (buffer_.size() > safetyTail_) {
            size_t n = buffer_.size() - safetyTail_;
            handler_.onPartData(buffer_.data(), n);
            s.bytes += n;
            buffer_.erase(0, n);
        }
        return false;
    }

    if (pos > 0) {
        handler_.onPartData(buffer_.data(), pos);
        s.bytes += pos;
    }
    handler_.onPartEnd(s.headers);
    buffer_.erase(0, pos + 2);
    state_ = SeekingPart{};
    return true;
}

bool MultipartStreamParser::step(SkippingPart&) {
    // Only a CRLF-prefixed boundary ends the part; "--boundary" mid-line is body data
    size_t pos = buffer_.find(delimiter_);
    if (pos == std::string::npos) {
        size_t keep = delimiter_.size() - 1;
        if (buffer_.size() > keep) {
            buffer_.erase(0, buffer_.size() - keep);
        }
        return false;
    }
    buffer_.erase(0, pos + 2);
    state_ = SeekingPart{};
    return true;
}

bool MultipartStreamParser::step(Done&) {
    buffer_.clear();
    return false;
}

} // namespace http
} // namespace lanshare
