// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#include "SubjectRecordLoader.h"
#include <fstream>
#include <sstream>
#include <rapidjson/error/en.h>

using namespace rapidjson;

namespace abvalidator
{
  std::vector<SubjectRecord> SubjectRecordLoader::loadFromFile(const std::string& filePath)
  {
    std::ifstream file(filePath);
    if (!file.is_open())
      throw SubjectDataException("SubjectRecordLoader - cannot open subject file: " + filePath);

    std::stringstream buffer;
    buffer << file.rdbuf();
    std::string jsonContent = buffer.str();

    try
      {
	return loadFromString(jsonContent);
      }
    catch (const SubjectDataException& e)
      {
	throw SubjectDataException(std::string(e.what()) + " (file: " + filePath + ")");
      }
  }

  std::vector<SubjectRecord> SubjectRecordLoader::loadFromString(const std::string& jsonContent)
  {
    Document doc;
    doc.Parse(jsonContent.c_str());

    if (doc.HasParseError())
      throw SubjectDataException(std::string("SubjectRecordLoader - JSON parse error at offset ") +
				 std::to_string(doc.GetErrorOffset()) + ": " +
				 GetParseError_En(doc.GetParseError()));

    return parseRecords(doc);
  }

  std::vector<SubjectRecord> SubjectRecordLoader::parseRecords(const Document& doc)
  {
    if (!doc.IsArray())
      throw SubjectDataException("SubjectRecordLoader - subject data must be a JSON array of records");

    std::vector<SubjectRecord> records;
    records.reserve(doc.Size());
    for (SizeType i = 0; i < doc.Size(); ++i)
      records.push_back(parseRecord(doc[i], i));

    return records;
  }

  SubjectRecord SubjectRecordLoader::parseRecord(const Value& value, SizeType index)
  {
    std::string where = "SubjectRecordLoader - record " + std::to_string(index);

    if (!value.IsObject())
      throw SubjectDataException(where + " is not a JSON object");

    if (!value.HasMember("user_id"))
      throw SubjectDataException(where + " has no 'user_id'");

    if (!value.HasMember("event"))
      throw SubjectDataException(where + " has no 'event'");

    const Value& userId = value["user_id"];
    const Value& event = value["event"];

    if (!event.IsInt())
      throw SubjectDataException(where + ": 'event' must be the integer 0 or 1");

    if (event.GetInt() != 0 && event.GetInt() != 1)
      throw SubjectDataException(where + ": 'event' is " + std::to_string(event.GetInt()) +
				 ", expected 0 or 1");

    if (userId.IsString())
      return SubjectRecord(SubjectId(std::string(userId.GetString(), userId.GetStringLength())),
			   event.GetInt());

    if (userId.IsInt64())
      return SubjectRecord(SubjectId(userId.GetInt64()), event.GetInt());

    // Above INT64_MAX; keep the decimal form so it buckets like its string
    if (userId.IsUint64())
      return SubjectRecord(SubjectId(std::to_string(userId.GetUint64())), event.GetInt());

    throw SubjectDataException(where + ": 'user_id' must be a string or an integer");
  }
}
