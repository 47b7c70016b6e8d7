//
//  seedrl
//  Copyright (c) 2018 CSE-Lab, ETH Zurich, Switzerland. All rights reserved.
//  Distributed under the terms of the MIT license.
//

#include "Message.h"
#include <cstring> // memcpy
#include <stdexcept>

namespace seedrl
{

namespace
{

class MessageWriter
{
  std::vector<char>& buffer;

public:
  MessageWriter(std::vector<char>& B) : buffer(B) {}

  void putBytes(const void * const data, const size_t size)
  {
    if(size == 0) return;
    const size_t msgPos = buffer.size();
    buffer.resize(msgPos + size);
    memcpy(buffer.data() + msgPos, data, size);
  }

  template<typename T>
  void put(const T& value) { putBytes(&value, sizeof(T)); }

  void putFields(const FieldMap& fields)
  {
    put<unsigned>(fields.size());
    for(const auto& f : fields)
    {
      put<unsigned>(f.first.size());
      putBytes(f.first.data(), f.first.size());
      put<int>(f.second.numeric ? 1 : 0);
      if(f.second.numeric) {
        put<unsigned>(f.second.values.size());
        putBytes(f.second.values.data(), sizeof(Fval) * f.second.values.size());
      } else {
        put<unsigned>(f.second.text.size());
        putBytes(f.second.text.data(), f.second.text.size());
      }
    }
  }
};

class MessageReader
{
  const std::vector<char>& buffer;
  size_t msgPos = 0;

  void need(const size_t size) const
  {
    if(msgPos + size > buffer.size())
      throw std::runtime_error("truncated message: need " + std::to_string(size)
        + " bytes at " + std::to_string(msgPos) + " of "
        + std::to_string(buffer.size()));
  }

public:
  MessageReader(const std::vector<char>& B) : buffer(B) {}

  void getBytes(void * const data, const size_t size)
  {
    if(size == 0) return;
    need(size);
    memcpy(data, buffer.data() + msgPos, size);
    msgPos += size;
  }

  template<typename T>
  T get() { T ret; getBytes(&ret, sizeof(T)); return ret; }

  template<typename T>
  std::vector<T> getVector(const unsigned size)
  {
    need(sizeof(T) * size);
    std::vector<T> ret(size);
    getBytes(ret.data(), sizeof(T) * size);
    return ret;
  }

  std::string getString()
  {
    const unsigned size = get<unsigned>();
    need(size);
    std::string ret(buffer.data() + msgPos, size);
    msgPos += size;
    return ret;
  }

  FieldMap getFields()
  {
    FieldMap ret;
    const unsigned nFields = get<unsigned>();
    for(unsigned i=0; i<nFields; ++i)
    {
      const std::string name = getString();
      const int numeric = get<int>();
      if(numeric) {
        const unsigned size = get<unsigned>();
        ret[name] = Field(getVector<Fval>(size));
      } else {
        ret[name] = Field(getString());
      }
    }
    return ret;
  }

  bool finished() const { return msgPos == buffer.size(); }
};

} // end anonymous namespace

std::vector<char> packStateMsg(const Uint sourceID, const FieldMap& observation,
                               const FieldMap& metrics)
{
  std::vector<char> buffer;
  MessageWriter msg(buffer);
  msg.put<unsigned>(sourceID);
  msg.putFields(observation);
  msg.putFields(metrics);
  return buffer;
}

StateMessage unpackStateMsg(const std::vector<char>& buffer)
{
  MessageReader msg(buffer);
  StateMessage ret;
  ret.sourceID = msg.get<unsigned>();
  ret.observation = msg.getFields();
  ret.metrics = msg.getFields();
  if(not msg.finished())
    throw std::runtime_error("trailing bytes after state message");
  return ret;
}

std::vector<char> packActionMsg(const Response& response)
{
  std::vector<char> buffer;
  MessageWriter msg(buffer);
  msg.put<unsigned>(response.sourceID);
  msg.put<learnerStatus>(response.status);
  msg.put<Sint>(response.trainingSteps);
  msg.put<unsigned>(response.action.size());
  msg.putBytes(response.action.data(), sizeof(Real) * response.action.size());
  return buffer;
}

Response unpackActionMsg(const std::vector<char>& buffer)
{
  MessageReader msg(buffer);
  Response ret;
  ret.sourceID = msg.get<unsigned>();
  ret.status = msg.get<learnerStatus>();
  ret.trainingSteps = msg.get<Sint>();
  const unsigned actDim = msg.get<unsigned>();
  ret.action = msg.getVector<Real>(actDim);
  if(not msg.finished())
    throw std::runtime_error("trailing bytes after action message");
  return ret;
}

} // end namespace seedrl
