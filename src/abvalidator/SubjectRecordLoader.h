// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#pragma once

#include <string>
#include <vector>
#include <rapidjson/document.h>
#include "AbTestException.h"
#include "SubjectRecord.h"

namespace abvalidator
{
  // Subject data that cannot be turned into SubjectRecords: unreadable file,
  // malformed JSON, missing fields or fields of the wrong type.
  class SubjectDataException : public AbTestException
  {
  public:
    SubjectDataException(const std::string msg)
      : AbTestException(msg)
    {}

    ~SubjectDataException()
    {}
  };

  /**
   * @class SubjectRecordLoader
   * @brief Loads subject records from a JSON array of objects
   *
   *     [ {"user_id": "alice", "event": 1}, {"user_id": 42, "event": 0}, ... ]
   *
   * user_id is a string or an integer; event is the integer 0 or 1. Extra
   * members are ignored. Any other shape throws SubjectDataException naming
   * the offending element, so that no record reaches the experiment core
   * unless the whole file is valid.
   */
  class SubjectRecordLoader
  {
  public:
    static std::vector<SubjectRecord> loadFromFile(const std::string& filePath);

    static std::vector<SubjectRecord> loadFromString(const std::string& jsonContent);

  private:
    static std::vector<SubjectRecord> parseRecords(const rapidjson::Document& doc);

    static SubjectRecord parseRecord(const rapidjson::Value& value, rapidjson::SizeType index);
  };
}
