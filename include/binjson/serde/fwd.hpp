#pragma once

#include "binjson/core/error.hpp"
#include "binjson/value/value.hpp"

#include <concepts>

namespace binjson::serde {

class Encoder;
class Decoder;

/**
 * @brief 类型的形状描述：把 T 描述给 Encoder（serialize），以及从 Decoder 重建 T（deserialize）。
 *
 * 特化要求：
 * - static core::Error serialize(const T& v, const Encoder& enc, Value& out);
 * - static core::Error deserialize(Decoder& dec, T& out);
 *
 * 只需要单向转换的类型可以只提供其中一个。主模板为空：未特化的类型不满足下面的 concept。
 */
template <class T>
struct Serde {};

template <class T>
concept Serializable = requires(const T& v, const Encoder& enc, Value& out) {
  { Serde<T>::serialize(v, enc, out) } -> std::same_as<core::Error>;
};

template <class T>
concept Deserializable = std::default_initializable<T> && requires(Decoder& dec, T& out) {
  { Serde<T>::deserialize(dec, out) } -> std::same_as<core::Error>;
};

}  // namespace binjson::serde
