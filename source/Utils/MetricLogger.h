//
//  seedrl
//  Copyright (c) 2018 CSE-Lab, ETH Zurich, Switzerland. All rights reserved.
//  Distributed under the terms of the MIT license.
//

#ifndef seedrl_MetricLogger_h
#define seedrl_MetricLogger_h

#include "Utils/Definitions.h"
#include <map>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

namespace seedrl
{

// ordered list of (name, value) pairs: one line of a channel
typedef std::vector<std::pair<std::string, double>> MetricRecord;

class MetricLogger
{
public:
  virtual ~MetricLogger() {}
  // may throw, callers catch and report
  virtual void log(const std::string& channel, const MetricRecord& record) = 0;
  virtual void flush() = 0;
};

// Buffers records in memory and appends them to one whitespace separated
// file per channel: <savePath>/<expName>/<channel>_rank<RR>.log
// The first line written to a file is the header with the record's names.
class FileLogger : public MetricLogger
{
  const std::string folder;
  const Uint rank;
  const Uint bufferedLines;

  std::mutex buffer_mutex;
  std::map<std::string, std::vector<std::string>> buffers;
  std::map<std::string, bool> headerWritten;

  std::string filePath(const std::string& channel) const;
  void writeChannel(const std::string& channel, std::vector<std::string>& lines);

public:
  FileLogger(const std::string& savePath, const std::string& expName,
             const Uint rank, const Uint bufferedLines = 100);
  ~FileLogger() override;

  void log(const std::string& channel, const MetricRecord& record) override;
  void flush() override;

  const std::string& directory() const { return folder; }
};

} // end namespace seedrl
#endif // seedrl_MetricLogger_h
