#include "internal/serdes/serdes.hpp"

#include <google/protobuf/io/coded_stream.h>
#include <google/protobuf/io/zero_copy_stream_impl_lite.h>
#include <google/protobuf/util/json_util.h>
#include <openssl/evp.h>

#include <iomanip>
#include <sstream>

namespace runvault::serdes {

std::string ValueToJson(const google::protobuf::Value& value) {
  std::string json;
  auto status = google::protobuf::util::MessageToJsonString(value, &json);
  if (!status.ok()) {
    throw util::SerializationError("cannot print JSON: " + std::string(status.message()));
  }
  return json;
}

google::protobuf::Value JsonToValue(const std::string& json) {
  google::protobuf::Value value;
  auto status = google::protobuf::util::JsonStringToMessage(json, &value);
  if (!status.ok()) {
    throw util::SerializationError("invalid JSON payload: " + std::string(status.message()));
  }
  return value;
}

std::any UnpackAny(const PackedValue& packed, const Registry& registry) {
  return registry.DecodeComposite(packed.value(), std::nullopt);
}

std::any DeserializeAny(const std::string& json, const Registry& registry) {
  return UnpackAny(PackedValue(JsonToValue(json)), registry);
}

namespace {

// RAII wrapper for OpenSSL EVP_MD_CTX
class EvpDigestCtx {
 public:
  EvpDigestCtx() : ctx_(EVP_MD_CTX_new()) {
    if (!ctx_) throw std::runtime_error("Failed to create EVP digest context");
  }
  ~EvpDigestCtx() {
    EVP_MD_CTX_free(ctx_);
  }
  EvpDigestCtx(const EvpDigestCtx&)            = delete;
  EvpDigestCtx& operator=(const EvpDigestCtx&) = delete;

  EVP_MD_CTX* get() const {
    return ctx_;
  }

 private:
  EVP_MD_CTX* ctx_;
};

std::string Sha1Hex(const std::string& data) {
  EvpDigestCtx  ctx;
  unsigned char digest[EVP_MAX_MD_SIZE];
  unsigned int  digest_len = 0;

  if (EVP_DigestInit_ex(ctx.get(), EVP_sha1(), nullptr) != 1 ||
      EVP_DigestUpdate(ctx.get(), data.data(), data.size()) != 1 ||
      EVP_DigestFinal_ex(ctx.get(), digest, &digest_len) != 1) {
    throw std::runtime_error("EVP SHA-1 digest failed");
  }

  std::ostringstream oss;
  for (unsigned int i = 0; i < digest_len; ++i) {
    oss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(digest[i]);
  }
  return oss.str();
}

} // namespace

std::string CreateSnapshotId(const PackedValue& packed) {
  // map entries are sorted only by a deterministic serializer
  std::string bytes;
  {
    google::protobuf::io::StringOutputStream stream(&bytes);
    google::protobuf::io::CodedOutputStream  coded(&stream);
    coded.SetSerializationDeterministic(true);
    packed.value().SerializeToCodedStream(&coded);
  }
  return Sha1Hex(bytes);
}

} // namespace runvault::serdes
