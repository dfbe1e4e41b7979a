// Licensed to the Apache Software Foundation (ASF) under one
// or more contributor license agreements.  See the NOTICE file
// distributed with this work for additional information
// regarding copyright ownership.  The ASF licenses this file
// to you under the Apache License, Version 2.0 (the
// "License"); you may not use this file except in compliance
// with the License.  You may obtain a copy of the License at
//
//     http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#include <cctype>
#include <string>

#include <ownable/address.hpp>

#include <stout/error.hpp>
#include <stout/foreach.hpp>
#include <stout/strings.hpp>

using std::string;

namespace ownable {

static Address* createZeroAddress()
{
  Address* zero = new Address();
  zero->set_value("0x0");
  return zero;
}


const Address& ZERO_ADDRESS()
{
  static const Address* zero = createZeroAddress();

  return *zero;
}


namespace address {

Try<Address> parse(const string& value)
{
  if (!strings::startsWith(value, "0x") && !strings::startsWith(value, "0X")) {
    return Error("Address '" + value + "' is missing the '0x' prefix");
  }

  string digits = strings::lower(value.substr(2));

  if (digits.empty()) {
    return Error("Address '" + value + "' has no digits");
  }

  foreach (char c, digits) {
    if (!isxdigit(static_cast<unsigned char>(c))) {
      return Error(
          "Address '" + value + "' contains a non-hexadecimal character");
    }
  }

  size_t first = digits.find_first_not_of('0');
  digits = first == string::npos ? "0" : digits.substr(first);

  // Lowercase hexadecimal digits above '7' all sort after it.
  if (digits.size() > MAX_ADDRESS_DIGITS ||
      (digits.size() == MAX_ADDRESS_DIGITS && digits[0] > '7')) {
    return Error("Address '" + value + "' does not fit in 251 bits");
  }

  Address address;
  address.set_value("0x" + digits);
  return address;
}


bool isZero(const Address& address)
{
  if (!address.has_value()) {
    return true;
  }

  string digits = address.value();

  if (strings::startsWith(digits, "0x") || strings::startsWith(digits, "0X")) {
    digits = digits.substr(2);
  }

  // NOTE: This looks at the value numerically since the core also sees
  // addresses that did not go through `parse`, e.g. "0x00".
  return digits.find_first_not_of('0') == string::npos;
}

} // namespace address {
} // namespace ownable {
