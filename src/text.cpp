#include "text.hpp"
#include "exception.hpp"
#include "localization.hpp"

#include <iconv.h>

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <format>
#include <vector>

namespace archivefile {

namespace {
    constexpr std::string_view REPLACEMENT_CHARACTER = "\xEF\xBF\xBD";
    constexpr std::string_view UTF8_BOM = "\xEF\xBB\xBF";

    // RAII for iconv descriptors
    class IconvHandle {
    public:
        IconvHandle(const std::string& to, const std::string& from)
            : cd_(iconv_open(to.c_str(), from.c_str())) {}
        ~IconvHandle() {
            if (valid()) iconv_close(cd_);
        }
        IconvHandle(const IconvHandle&) = delete;
        IconvHandle& operator=(const IconvHandle&) = delete;

        bool valid() const { return cd_ != reinterpret_cast<iconv_t>(-1); }
        iconv_t get() const { return cd_; }

    private:
        iconv_t cd_;
    };

    std::string normalize_encoding(const std::string& encoding) {
        std::string key = encoding;
        std::transform(key.begin(), key.end(), key.begin(), [](unsigned char c) {
            return c == '_' ? '-' : static_cast<char>(std::tolower(c));
        });

        if (key == "utf-8" || key == "utf8" || key == "u8") return "UTF-8";
        if (key == "utf-8-sig" || key == "utf8-sig") return "UTF-8-SIG";
        if (key == "latin-1" || key == "latin1" || key == "l1" || key == "iso-8859-1" || key == "iso8859-1") return "ISO-8859-1";
        if (key == "ascii" || key == "us-ascii") return "ASCII";

        std::string upper = encoding;
        std::transform(upper.begin(), upper.end(), upper.begin(),
                       [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
        return upper;
    }

    // Collects decoded output and applies the error policy to data[pos, pos + length)
    class DecodeSink {
    public:
        DecodeSink(std::string_view data, const std::string& encoding, DecodePolicy policy)
            : data_(data), encoding_(encoding), policy_(policy) {}

        void append(std::string_view text) { out_.append(text); }

        void invalid(std::size_t pos, std::size_t length, const std::string& reason_key) {
            switch (policy_) {
                case DecodePolicy::STRICT:
                    throw TextDecodeError(
                        string_format("error.decode_failed", encoding_,
                                      static_cast<unsigned int>(static_cast<unsigned char>(data_[pos])),
                                      pos, get_string(reason_key)),
                        encoding_, pos);
                case DecodePolicy::IGNORE:
                    break;
                case DecodePolicy::REPLACE:
                    out_.append(REPLACEMENT_CHARACTER);
                    break;
                case DecodePolicy::BACKSLASH_REPLACE:
                    for (std::size_t i = pos; i < pos + length && i < data_.size(); ++i) {
                        out_ += std::format("\\x{:02x}", static_cast<unsigned int>(static_cast<unsigned char>(data_[i])));
                    }
                    break;
            }
        }

        std::string release() { return std::move(out_); }

    private:
        std::string_view data_;
        const std::string& encoding_;
        DecodePolicy policy_;
        std::string out_;
    };

    // UTF-8 validation with maximal-subpart error reporting
    std::string decode_utf8(std::string_view data, DecodeSink& sink) {
        std::size_t i = 0;
        const std::size_t n = data.size();
        while (i < n) {
            const auto c = static_cast<unsigned char>(data[i]);
            if (c < 0x80) {
                std::size_t j = i + 1;
                while (j < n && static_cast<unsigned char>(data[j]) < 0x80) ++j;
                sink.append(data.substr(i, j - i));
                i = j;
                continue;
            }

            std::size_t need = 0;
            unsigned char lo = 0x80, hi = 0xBF;
            if (c >= 0xC2 && c <= 0xDF) {
                need = 1;
            } else if (c == 0xE0) {
                need = 2; lo = 0xA0;
            } else if ((c >= 0xE1 && c <= 0xEC) || c == 0xEE || c == 0xEF) {
                need = 2;
            } else if (c == 0xED) {
                need = 2; hi = 0x9F;
            } else if (c == 0xF0) {
                need = 3; lo = 0x90;
            } else if (c >= 0xF1 && c <= 0xF3) {
                need = 3;
            } else if (c == 0xF4) {
                need = 3; hi = 0x8F;
            } else {
                sink.invalid(i, 1, "reason.invalid_utf8");
                ++i;
                continue;
            }

            std::size_t j = 1;
            bool complete = true;
            for (; j <= need; ++j) {
                if (i + j >= n) {
                    sink.invalid(i, j, "reason.unexpected_end");
                    complete = false;
                    break;
                }
                const auto cc = static_cast<unsigned char>(data[i + j]);
                const unsigned char low = (j == 1) ? lo : 0x80;
                const unsigned char high = (j == 1) ? hi : 0xBF;
                if (cc < low || cc > high) {
                    sink.invalid(i, j, "reason.invalid_continuation");
                    complete = false;
                    break;
                }
            }

            if (complete) {
                sink.append(data.substr(i, need + 1));
                i += need + 1;
            } else {
                i += j;
            }
        }
        return sink.release();
    }

    std::string decode_iconv(std::string_view data, const std::string& charset, const std::string& encoding, DecodeSink& sink) {
        IconvHandle cd("UTF-8", charset);
        if (!cd.valid()) {
            throw TextDecodeError(string_format("error.unknown_encoding", encoding), encoding);
        }

        std::vector<char> buffer(4096);
        std::size_t pos = 0;
        while (pos < data.size()) {
            char* in = const_cast<char*>(data.data() + pos);
            std::size_t in_left = data.size() - pos;
            char* out = buffer.data();
            std::size_t out_left = buffer.size();

            std::size_t rc = iconv(cd.get(), &in, &in_left, &out, &out_left);
            int err = errno;
            sink.append(std::string_view(buffer.data(), buffer.size() - out_left));
            pos = data.size() - in_left;

            if (rc != static_cast<std::size_t>(-1)) {
                break;
            }
            if (err == E2BIG) {
                continue;
            }
            if (err == EILSEQ || err == EINVAL) {
                sink.invalid(pos, 1, err == EILSEQ ? "reason.invalid_sequence" : "reason.unexpected_end");
                ++pos;
                iconv(cd.get(), nullptr, nullptr, nullptr, nullptr);
                continue;
            }
            throw TextDecodeError(string_format("error.unknown_encoding", encoding), encoding, pos);
        }

        char* out = buffer.data();
        std::size_t out_left = buffer.size();
        iconv(cd.get(), nullptr, nullptr, &out, &out_left);
        sink.append(std::string_view(buffer.data(), buffer.size() - out_left));
        return sink.release();
    }
}

DecodePolicy parse_decode_policy(const std::string& name, const std::string& encoding) {
    if (name == "strict") return DecodePolicy::STRICT;
    if (name == "ignore") return DecodePolicy::IGNORE;
    if (name == "replace") return DecodePolicy::REPLACE;
    if (name == "backslashreplace") return DecodePolicy::BACKSLASH_REPLACE;
    throw TextDecodeError(string_format("error.unknown_error_handler", name), encoding);
}

std::string decode_text(std::string_view data, const std::string& encoding, const std::string& errors) {
    const DecodePolicy policy = parse_decode_policy(errors, encoding);
    const std::string charset = normalize_encoding(encoding);
    DecodeSink sink(data, encoding, policy);

    if (charset == "UTF-8-SIG") {
        if (data.starts_with(UTF8_BOM)) {
            data.remove_prefix(UTF8_BOM.size());
            DecodeSink unbommed(data, encoding, policy);
            return decode_utf8(data, unbommed);
        }
        return decode_utf8(data, sink);
    }
    if (charset == "UTF-8") {
        return decode_utf8(data, sink);
    }
    return decode_iconv(data, charset, encoding, sink);
}

} // namespace archivefile
