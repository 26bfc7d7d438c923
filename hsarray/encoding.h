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

#ifndef HSARRAY_ENCODING_H_
#define HSARRAY_ENCODING_H_

/// \file
/// Enumerations shared by the wire type descriptors and native element types.

#include <iosfwd>
#include <string_view>

#include "absl/base/config.h"

namespace hsarray {

/// Byte order of a multi-byte numeric element.
enum class ByteOrder {
  kLittle,
  kBig,
  /// Single-byte and non-numeric elements.
  kNotApplicable,
};

#ifdef ABSL_IS_LITTLE_ENDIAN
constexpr ByteOrder kNativeByteOrder = ByteOrder::kLittle;
#else
constexpr ByteOrder kNativeByteOrder = ByteOrder::kBig;
#endif

/// Character set of string elements.
enum class Charset {
  kAscii,
  kUtf8,
};

/// Padding of fixed-length strings.
enum class StrPad {
  kNullTerm,
  kNullPad,
  kSpacePad,
};

/// Kind of reference element.
enum class ReferenceFlavor {
  kObject,
  kRegion,
};

std::string_view ToString(ByteOrder order);
std::string_view ToString(Charset charset);
std::string_view ToString(StrPad pad);
std::string_view ToString(ReferenceFlavor flavor);

std::ostream& operator<<(std::ostream& os, ByteOrder order);
std::ostream& operator<<(std::ostream& os, Charset charset);
std::ostream& operator<<(std::ostream& os, StrPad pad);
std::ostream& operator<<(std::ostream& os, ReferenceFlavor flavor);

}  // namespace hsarray

#endif  // HSARRAY_ENCODING_H_
