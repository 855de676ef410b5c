// ---------------------------------------------------------------------------
// fingerprint.cpp
// ---------------------------------------------------------------------------

#include "common/fingerprint.hpp"

#include "common/json_util.hpp"

#include <array>
#include <cctype>
#include <chrono>
#include <memory>
#include <random>
#include <vector>

#include <openssl/evp.h>
#include <openssl/rand.h>
#include <spdlog/spdlog.h>

namespace {

std::string to_hex(const unsigned char* data, std::size_t len) {
    static constexpr char kHex[] = "0123456789abcdef";
    std::string out;
    out.reserve(len * 2);
    for (std::size_t i = 0; i < len; ++i) {
        out += kHex[data[i] >> 4];
        out += kHex[data[i] & 0x0F];
    }
    return out;
}

struct EvpMdCtxDeleter {
    void operator()(EVP_MD_CTX* ctx) const noexcept { EVP_MD_CTX_free(ctx); }
};

}  // namespace

std::string normalize_sql(std::string_view sql) {
    std::string out;
    out.reserve(sql.size());

    bool pending_space = false;
    auto emit = [&](char c) {
        if (pending_space && !out.empty()) {
            out += ' ';
        }
        pending_space = false;
        out += c;
    };

    const std::size_t len = sql.size();
    std::size_t i = 0;
    while (i < len) {
        const char c    = sql[i];
        const char next = (i + 1 < len) ? sql[i + 1] : '\0';

        if (c == '/' && next == '*') {
            i += 2;
            while (i + 1 < len && !(sql[i] == '*' && sql[i + 1] == '/')) {
                ++i;
            }
            i = (i + 1 < len) ? i + 2 : len;
            pending_space = true;
            continue;
        }
        if (c == '-' && next == '-') {
            while (i < len && sql[i] != '\n') {
                ++i;
            }
            pending_space = true;
            continue;
        }
        if (c == '\'' || c == '"' || c == '`') {
            // 리터럴/인용 식별자는 원문 보존. 파서와 같이 중복 따옴표만 이스케이프로 본다.
            emit(c);
            ++i;
            while (i < len) {
                out += sql[i];
                if (sql[i] == c) {
                    if (i + 1 < len && sql[i + 1] == c) {
                        out += c;
                        i += 2;
                        continue;
                    }
                    ++i;
                    break;
                }
                ++i;
            }
            continue;
        }
        if (std::isspace(static_cast<unsigned char>(c)) != 0) {
            pending_space = true;
            ++i;
            continue;
        }
        emit(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
        ++i;
    }

    // 끝 세미콜론(및 그 사이 공백) 제거
    while (!out.empty() && (out.back() == ';' || out.back() == ' ')) {
        out.pop_back();
    }
    return out;
}

std::string fingerprint(std::string_view sql) {
    const std::string normalized = normalize_sql(sql);

    std::unique_ptr<EVP_MD_CTX, EvpMdCtxDeleter> ctx{EVP_MD_CTX_new()};
    std::array<unsigned char, EVP_MAX_MD_SIZE> digest{};
    unsigned int digest_len = 0;

    if (!ctx ||
        EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1 ||
        EVP_DigestUpdate(ctx.get(), normalized.data(), normalized.size()) != 1 ||
        EVP_DigestFinal_ex(ctx.get(), digest.data(), &digest_len) != 1) {
        // 지문은 감사 상관관계용이므로 실패 시 정규화 문자열 자체를 남긴다.
        spdlog::error("fingerprint: EVP sha256 failed, falling back to normalized text");
        return "raw:" + normalized;
    }

    return to_hex(digest.data(), digest_len);
}

std::string random_hex(std::size_t n_bytes) {
    std::vector<unsigned char> buf(n_bytes);
    if (RAND_bytes(buf.data(), static_cast<int>(buf.size())) != 1) {
        spdlog::warn("fingerprint: RAND_bytes failed, using std::random_device");
        std::random_device rd;
        for (auto& b : buf) {
            b = static_cast<unsigned char>(rd() & 0xFFu);
        }
    }
    return to_hex(buf.data(), buf.size());
}

std::string make_run_id() {
    return "RUN_" + format_compact_utc(std::chrono::system_clock::now()) + "_" + random_hex(4);
}

std::string make_snapshot_id() {
    return "SNAPSHOT_" + format_compact_utc(std::chrono::system_clock::now()) + "_" + random_hex(4);
}
