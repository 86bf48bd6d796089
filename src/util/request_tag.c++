#include "request_tag.h++"

namespace Tessera {
  RequestTag::RequestTag(const Generator& generate) : _id(generate()) {
    if (_id.empty()) throw std::logic_error("RequestTag: generator returned an empty ID");
  }
}
