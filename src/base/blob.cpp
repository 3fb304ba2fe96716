#include "base/blob.hpp"

namespace csync::base {

  template class Blob<32ul>;

}  // namespace csync::base
