//
//  seedrl
//  Copyright (c) 2018 CSE-Lab, ETH Zurich, Switzerland. All rights reserved.
//  Distributed under the terms of the MIT license.
//

#include "MetricLogger.h"
#include "Utils/Warnings.h"

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <stdexcept>
#include <sys/stat.h>
#include <sys/types.h>

namespace seedrl
{

static void makeDirectory(const std::string& path)
{
  if(path.empty() || path == ".") return;
  if(mkdir(path.c_str(), 0755) == 0 || errno == EEXIST) return;
  throw std::runtime_error("cannot create log folder " + path + ": "
                           + strerror(errno));
}

FileLogger::FileLogger(const std::string& savePath, const std::string& expName,
  const Uint _rank, const Uint nBuffered) :
  folder(expName.empty() ? savePath : savePath + "/" + expName),
  rank(_rank), bufferedLines(nBuffered)
{
  makeDirectory(savePath);
  makeDirectory(folder);
}

FileLogger::~FileLogger()
{
  try {
    flush();
  } catch(const std::exception& e) {
    _warn("could not write metrics to %s: %s", folder.c_str(), e.what());
  }
}

std::string FileLogger::filePath(const std::string& channel) const
{
  char cpath[512];
  snprintf(cpath, 512, "%s/%s_rank%02u.log", folder.c_str(), channel.c_str(), rank);
  return std::string(cpath);
}

void FileLogger::log(const std::string& channel, const MetricRecord& record)
{
  std::lock_guard<std::mutex> lock(buffer_mutex);
  auto& lines = buffers[channel];

  if(not headerWritten[channel] && lines.empty()) {
    std::string header;
    for(const auto& entry : record) header += entry.first + " ";
    lines.push_back(header);
  }

  std::string line;
  char BUF[64];
  for(const auto& entry : record) {
    snprintf(BUF, 64, "%.8g ", entry.second);
    line += BUF;
  }
  lines.push_back(line);

  if(lines.size() >= bufferedLines) writeChannel(channel, lines);
}

void FileLogger::writeChannel(const std::string& channel,
                              std::vector<std::string>& lines)
{
  if(lines.empty()) return;
  const std::string path = filePath(channel);
  FILE * pFile = fopen(path.c_str(), "a");
  if(pFile == nullptr)
    throw std::runtime_error("cannot open " + path + ": " + strerror(errno));
  for(const auto& line : lines) fprintf(pFile, "%s\n", line.c_str());
  fflush(pFile); fclose(pFile);
  headerWritten[channel] = true;
  lines.clear();
}

void FileLogger::flush()
{
  std::lock_guard<std::mutex> lock(buffer_mutex);
  for(auto& buffer : buffers) writeChannel(buffer.first, buffer.second);
}

} // end namespace seedrl
