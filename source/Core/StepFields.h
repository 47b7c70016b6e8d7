//
//  seedrl
//  Copyright (c) 2018 CSE-Lab, ETH Zurich, Switzerland. All rights reserved.
//  Distributed under the terms of the MIT license.
//

#ifndef seedrl_StepFields_h
#define seedrl_StepFields_h

#include "Utils/Definitions.h"
#include <map>
#include <stdexcept>
#include <string>

namespace seedrl
{

// One named entry of an observation, of a model output or of a metrics map.
// Numeric fields are flat arrays, everything else is carried as text.
struct Field
{
  bool numeric = true;
  Fvec values;
  std::string text;

  Field() {}
  Field(const Fvec& v) : numeric(true), values(v) {}
  Field(const Fval v) : numeric(true), values(1, v) {}
  Field(const std::string& s) : numeric(false), text(s) {}
  Field(const char* s) : numeric(false), text(s) {}

  Uint dim() const { return numeric ? values.size() : 0; }
  Fval scalar() const
  {
    if(not numeric || values.empty())
      throw std::invalid_argument("Field is not a numeric scalar");
    return values[0];
  }
};

typedef std::map<std::string, Field> FieldMap;

// numeric width of each stored field, the layout of a trajectory step
typedef std::map<std::string, Uint> StepLayout;

inline StepLayout layoutOf(const FieldMap& fields)
{
  StepLayout layout;
  for(const auto& f : fields)
    if(f.second.numeric) layout[f.first] = f.second.dim();
  return layout;
}

inline Fval scalarOr(const FieldMap& fields, const std::string& key,
                     const Fval fallback)
{
  const auto it = fields.find(key);
  if(it == fields.end() || not it->second.numeric || it->second.values.empty())
    return fallback;
  return it->second.values[0];
}

// Fields of nRows requests or model outputs. Numeric fields with the same
// width across all rows are stored row-major in `columns`, all others are
// kept one entry per row in `passthrough`.
struct BatchedFields
{
  Uint nRows = 0;
  std::map<std::string, Fvec> columns;
  std::map<std::string, std::vector<Field>> passthrough;

  Uint dim(const std::string& key) const
  {
    return nRows == 0 ? 0 : columns.at(key).size() / nRows;
  }

  const Fval* rowPtr(const std::string& key, const Uint i) const
  {
    return columns.at(key).data() + i * dim(key);
  }

  Field field(const std::string& key, const Uint i) const
  {
    const auto col = columns.find(key);
    if(col not_eq columns.end()) {
      const Uint D = dim(key);
      return Field(Fvec(col->second.begin() + i*D, col->second.begin() + (i+1)*D));
    }
    return passthrough.at(key).at(i);
  }

  FieldMap row(const Uint i) const
  {
    FieldMap ret;
    for(const auto& col : columns) ret[col.first] = field(col.first, i);
    for(const auto& pass : passthrough) ret[pass.first] = pass.second.at(i);
    return ret;
  }
};

} // end namespace seedrl
#endif // seedrl_StepFields_h
