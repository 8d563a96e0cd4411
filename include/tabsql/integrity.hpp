/**
 * tabsql/integrity.hpp - Canonical content hashes for JSON values
 *
 * Part of tabsql - a schema-versioned JSON table store on SQLite.
 *
 * A hash covers an object's canonical text with its own "_hash" field left
 * out: keys sorted, integral floats written as integers (3.0 and 3 hash the
 * same, whatever SQLite column affinity did to them). Nested "_hash" fields
 * of rows inside a table are part of the table's content.
 *
 * Digest: SHA-256, unpadded base64url, first 22 characters.
 */

#pragma once

#include "errors.hpp"
#include "json.hpp"

#include <openssl/evp.h>

#include <cmath>
#include <cstdint>
#include <memory>
#include <string>

namespace tabsql {

struct HashOptions {
    bool update_existing = false;   // Overwrite a present "_hash"
    bool fail_on_mismatch = false;  // Report HashMismatch instead of keeping a wrong hash
};

class IntegrityEngine {
public:
    static constexpr size_t kHashLength = 22;

    /**
     * Canonical text of value: top-level "_hash" removed, numbers normalized.
     */
    static Outcome<std::string> canonical_text(const json& value) {
        json copy = value;
        if (copy.is_object()) copy.erase(kHashField);
        normalize(copy);
        try {
            return Outcome<std::string>::of(copy.dump());
        } catch (const json::type_error& e) {
            return Outcome<std::string>::fail(ErrorCode::UnsupportedValue,
                                              std::string("Cannot canonicalize value: ") + e.what());
        }
    }

    static Outcome<std::string> hash_of(const json& value) {
        auto text = canonical_text(value);
        if (!text.ok()) return text;
        return digest(text.value);
    }

    /**
     * Write the content hash into value["_hash"] according to options.
     */
    static Status stamp(json& value, const HashOptions& options) {
        if (!value.is_object()) {
            return Status::fail(ErrorCode::UnsupportedValue, "Only JSON objects carry a hash");
        }
        auto computed = hash_of(value);
        if (!computed.ok()) return computed.status;

        auto it = value.find(kHashField);
        bool present = it != value.end() && it->is_string();
        if (!present || options.update_existing) {
            value[kHashField] = computed.value;
            return Status::success();
        }
        if (options.fail_on_mismatch && it->get<std::string>() != computed.value) {
            return Status::fail(ErrorCode::HashMismatch,
                                "Hash " + it->get<std::string>() + " does not match content hash " +
                                computed.value);
        }
        return Status::success();
    }

    static Status stamp_missing(json& value) {
        return stamp(value, HashOptions{});
    }

    /**
     * Recompute and compare; a missing hash is a mismatch.
     */
    static Status verify(const json& value) {
        if (!value.is_object() || !value.contains(kHashField) || !value[kHashField].is_string()) {
            return Status::fail(ErrorCode::HashMismatch, "Value carries no hash");
        }
        json copy = value;
        HashOptions strict;
        strict.fail_on_mismatch = true;
        return stamp(copy, strict);
    }

    static Outcome<std::string> digest(const std::string& text) {
        using R = Outcome<std::string>;
        std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> ctx(EVP_MD_CTX_new(),
                                                                    &EVP_MD_CTX_free);
        unsigned char md[EVP_MAX_MD_SIZE];
        unsigned int md_len = 0;
        if (!ctx ||
            EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1 ||
            EVP_DigestUpdate(ctx.get(), text.data(), text.size()) != 1 ||
            EVP_DigestFinal_ex(ctx.get(), md, &md_len) != 1) {
            return R::fail(ErrorCode::StorageError, "SHA-256 digest failed");
        }

        // 4 output chars per 3 input bytes, plus terminator
        unsigned char b64[((EVP_MAX_MD_SIZE + 2) / 3) * 4 + 1];
        int b64_len = EVP_EncodeBlock(b64, md, static_cast<int>(md_len));

        std::string out;
        out.reserve(kHashLength);
        for (int i = 0; i < b64_len && out.size() < kHashLength; ++i) {
            char c = static_cast<char>(b64[i]);
            if (c == '=') break;
            if (c == '+') c = '-';
            if (c == '/') c = '_';
            out += c;
        }
        return R::of(std::move(out));
    }

private:
    static void normalize(json& value) {
        if (value.is_object() || value.is_array()) {
            for (auto& child : value) normalize(child);
            return;
        }
        if (value.is_number_float()) {
            double d = value.get<double>();
            // 2^53: beyond it doubles no longer map one-to-one onto integers
            constexpr double kExact = 9007199254740992.0;
            if (std::isfinite(d) && std::floor(d) == d && std::fabs(d) <= kExact) {
                value = static_cast<int64_t>(d);
            }
        }
    }
};

} // namespace tabsql
