#pragma once
// address_pool.h - One long-lived object per bus address
//
// Driver objects that allocate in begin() and free nothing on destruction
// (Adafruit_VL6180X and its Adafruit_I2CDevice) are kept here and reused, so
// re-opening an address re-begins the same object instead of leaking a new
// one. Growth is bounded by the 128 possible addresses.

#include <stddef.h>
#include <stdint.h>
#include <map>
#include <memory>
#include <utility>

namespace multitof {

template <typename T>
class AddressPool {
public:
  // Constructs T(address) on first use.
  T& at(uint8_t address) {
    typename Map::iterator it = _items.find(address);
    if (it == _items.end()) {
      it = _items.insert(std::make_pair(address, std::unique_ptr<T>(new T(address)))).first;
    }
    return *it->second;
  }

  size_t size() const { return _items.size(); }

private:
  typedef std::map<uint8_t, std::unique_ptr<T> > Map;
  Map _items;
};

}  // namespace multitof
