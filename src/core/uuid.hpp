#ifndef HWBRIDGE_CORE_UUID_HPP_
#define HWBRIDGE_CORE_UUID_HPP_

#include <boost/uuid/random_generator.hpp>
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_io.hpp>

#include <string>

namespace hwbridge::core {

// Random (v4) UUID in canonical lowercase form. Used for WebSocket
// connection ids, device session ids and queue job ids.
inline std::string GenerateUuid() {
  thread_local boost::uuids::random_generator generator;
  return boost::uuids::to_string(generator());
}

} // namespace hwbridge::core

#endif // HWBRIDGE_CORE_UUID_HPP_
