// Copyright 2025 The HSArray Authors
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//      http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#include "hsarray/encoding.h"

#include <ostream>
#include <string_view>

#include "absl/base/optimization.h"

namespace hsarray {

std::string_view ToString(ByteOrder order) {
  switch (order) {
    case ByteOrder::kLittle:
      return "little";
    case ByteOrder::kBig:
      return "big";
    case ByteOrder::kNotApplicable:
      return "not applicable";
  }
  ABSL_UNREACHABLE();
}

std::string_view ToString(Charset charset) {
  switch (charset) {
    case Charset::kAscii:
      return "H5T_CSET_ASCII";
    case Charset::kUtf8:
      return "H5T_CSET_UTF8";
  }
  ABSL_UNREACHABLE();
}

std::string_view ToString(StrPad pad) {
  switch (pad) {
    case StrPad::kNullTerm:
      return "H5T_STR_NULLTERM";
    case StrPad::kNullPad:
      return "H5T_STR_NULLPAD";
    case StrPad::kSpacePad:
      return "H5T_STR_SPACEPAD";
  }
  ABSL_UNREACHABLE();
}

std::string_view ToString(ReferenceFlavor flavor) {
  switch (flavor) {
    case ReferenceFlavor::kObject:
      return "H5T_STD_REF_OBJ";
    case ReferenceFlavor::kRegion:
      return "H5T_STD_REF_DSETREG";
  }
  ABSL_UNREACHABLE();
}

std::ostream& operator<<(std::ostream& os, ByteOrder order) {
  return os << ToString(order);
}
std::ostream& operator<<(std::ostream& os, Charset charset) {
  return os << ToString(charset);
}
std::ostream& operator<<(std::ostream& os, StrPad pad) {
  return os << ToString(pad);
}
std::ostream& operator<<(std::ostream& os, ReferenceFlavor flavor) {
  return os << ToString(flavor);
}

}  // namespace hsarray
