#include "scpi-driver/transport/Transport.hpp"

namespace scpidrv {

QueryResult Transport::query(const std::string &command) {
  QueryResult result;
  result.status = write(command);
  if (result.status != 0) {
    return result;
  }
  result.status = read(result.response);
  if (result.status != 0) {
    result.response.clear();
  }
  return result;
}

} // namespace scpidrv
