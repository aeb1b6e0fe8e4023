// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#include "Bucketer.h"
#include <openssl/evp.h>

namespace abvalidator
{
  Bucketer::Bucketer(uint32_t bucketCount)
    : mBucketCount(bucketCount)
  {
    if (mBucketCount == 0)
      throw ConfigurationException("Bucketer: bucket count must be positive");
  }

  uint32_t Bucketer::bucket(const SubjectId& subjectId) const
  {
    return reduce(digest(subjectId.asString()), mBucketCount);
  }

  Bucketer::Digest Bucketer::digest(const std::string& canonicalId)
  {
    Digest result{};
    unsigned int digestSize = 0;

    if (EVP_Digest(canonicalId.data(), canonicalId.size(), result.data(), &digestSize,
		   EVP_sha256(), nullptr) != 1)
      throw BucketingException("Bucketer: SHA-256 digest of '" + canonicalId + "' failed");

    if (digestSize != DigestLength)
      throw BucketingException("Bucketer: unexpected SHA-256 digest length " +
			       std::to_string(digestSize));

    return result;
  }

  // Horner's rule over the digest bytes, most significant first. Each step
  // keeps the remainder below bucketCount so the intermediate value fits in
  // 64 bits for any 32 bit bucket count.
  uint32_t Bucketer::reduce(const Digest& digest, uint32_t bucketCount)
  {
    if (bucketCount == 0)
      throw ConfigurationException("Bucketer: bucket count must be positive");

    uint64_t remainder = 0;
    for (uint8_t byte : digest)
      remainder = ((remainder << 8) | byte) % bucketCount;

    return static_cast<uint32_t>(remainder);
  }
}
