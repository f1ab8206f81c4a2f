/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <cstdint>
#include <span>
#include <type_traits>

#include <openssl/crypto.h>

#include "common/blob.hpp"
#include "common/buffer.hpp"

namespace oasis::crypto {

  /**
   * A wrapper around a span of data
   * that securely cleans up the data when goes out of scope
   */
  template <typename T, size_t Size = std::dynamic_extent>
    requires std::is_standard_layout_v<T>
  struct SecureCleanGuard {
    static_assert(!std::is_const_v<T>,
                  "Secure clean guard must have write access to the data");

    explicit SecureCleanGuard(std::span<T, Size> data) : data{data} {}

    template <std::ranges::contiguous_range R>
      requires std::ranges::output_range<R, T>
    explicit SecureCleanGuard(R &&r) : data{r} {}

    SecureCleanGuard(const SecureCleanGuard &) = delete;
    SecureCleanGuard &operator=(const SecureCleanGuard &) = delete;
    SecureCleanGuard(SecureCleanGuard &&g) : data{g.data} {
      g.data = {};
    }
    SecureCleanGuard &operator=(SecureCleanGuard &&g) = delete;

    ~SecureCleanGuard() {
      OPENSSL_cleanse(data.data(), data.size_bytes());
    }

    std::span<T, Size> data;
  };

  template <std::ranges::contiguous_range R>
  SecureCleanGuard(R &&r) -> SecureCleanGuard<std::ranges::range_value_t<R>>;

  template <typename T, size_t N>
  SecureCleanGuard(std::array<T, N> &) -> SecureCleanGuard<T, N>;

  template <size_t N>
  SecureCleanGuard(common::Blob<N> &) -> SecureCleanGuard<uint8_t, N>;

  /**
   * Fixed-size secret key material, wiped from memory on destruction
   * @tparam Size - the key length
   * @tparam Tag - a type-safety tag
   */
  template <size_t Size, typename Tag>
  class PrivateKey {
   public:
    PrivateKey() = default;

    PrivateKey(const PrivateKey &) = default;
    PrivateKey &operator=(const PrivateKey &) = default;

    PrivateKey(PrivateKey &&key) = default;
    PrivateKey &operator=(PrivateKey &&key) = default;

    ~PrivateKey() {
      OPENSSL_cleanse(data_.data(), data_.size());
    }

    bool operator==(const PrivateKey &) const = default;

    static constexpr size_t size() {
      return Size;
    }

    /**
     * SecureCleanGuard ensures that data we used to initialize the key
     * is then immediately erased from its original unsafe storage
     */
    static PrivateKey from(SecureCleanGuard<uint8_t, Size> view) {
      PrivateKey key;
      std::copy(view.data.begin(), view.data.end(), key.data_.begin());
      return key;
    }

    /**
     * SecureCleanGuard ensures that data we used to initialize the key
     * is then immediately erased from its original unsafe storage
     */
    static outcome::result<PrivateKey> from(SecureCleanGuard<uint8_t> view) {
      if (view.data.size() != Size) {
        return common::BlobError::INCORRECT_LENGTH;
      }
      PrivateKey key;
      std::copy(view.data.begin(), view.data.end(), key.data_.begin());
      return key;
    }

    /**
     * Provides the direct read access to the private key bytes.
     * The bytes copied from here to unsafe memory must later be cleaned up with
     * SecureCleanGuard
     */
    [[nodiscard]] std::span<const uint8_t, Size> unsafeBytes() const {
      return std::span<const uint8_t, Size>(data_);
    }

   private:
    std::array<uint8_t, Size> data_{};
  };

}  // namespace oasis::crypto
