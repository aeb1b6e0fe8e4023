// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#ifndef __BUCKETER_H
#define __BUCKETER_H 1

#include <array>
#include <cstdint>
#include <string>
#include "SubjectRecord.h"

namespace abvalidator
{
  /**
   * @class Bucketer
   * @brief Deterministic map from a subject identifier to an integer bucket.
   *
   * The bucket of a subject is
   *
   *     SHA-256(canonical id as UTF-8 bytes) mod bucketCount
   *
   * where the 32 byte digest is read as an unsigned big-endian integer. This
   * is the same value produced by int(hashlib.sha256(id).hexdigest(), 16) %
   * bucketCount, so assignments are reproducible across processes, platforms
   * and implementations in other languages.
   *
   * A Bucketer holds no state besides the bucket count and is safe to share
   * between threads.
   */
  class Bucketer
  {
  public:
    static constexpr uint32_t DefaultBucketCount = 100;
    static constexpr std::size_t DigestLength = 32;

    using Digest = std::array<uint8_t, DigestLength>;

    explicit Bucketer(uint32_t bucketCount = DefaultBucketCount);

    uint32_t bucket(const SubjectId& subjectId) const;

    uint32_t getBucketCount() const
    {
      return mBucketCount;
    }

    // Raw SHA-256 digest of the canonical identifier.
    static Digest digest(const std::string& canonicalId);

    // Reduce a big-endian digest modulo bucketCount.
    static uint32_t reduce(const Digest& digest, uint32_t bucketCount);

  private:
    uint32_t mBucketCount;
  };
}

#endif
