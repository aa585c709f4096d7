#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

// XML-RPC value. Struct members are kept in declaration order.
class XmlRpcValue {
public:
  enum class Type { Nil, Bool, Int, Double, String, Array, Struct };

  XmlRpcValue() = default;
  XmlRpcValue(bool value);
  XmlRpcValue(int value);
  XmlRpcValue(int64_t value);
  XmlRpcValue(double value);
  XmlRpcValue(std::string value);
  XmlRpcValue(const char* value);

  static XmlRpcValue array(std::vector<XmlRpcValue> items = {});
  static XmlRpcValue structure();

  Type type() const { return type_; }
  bool is_nil() const { return type_ == Type::Nil; }

  // Converting accessors throw XmlRpcError when the value has another type.
  bool as_bool() const;
  int64_t as_int() const;
  double as_double() const;
  const std::string& as_string() const;
  const std::vector<XmlRpcValue>& as_array() const;

  void push_back(XmlRpcValue item);
  void set_member(const std::string& name, XmlRpcValue value);
  const XmlRpcValue* member(const std::string& name) const;

  std::string to_xml() const;

private:
  friend class XmlRpcResponseParser;

  Type type_ = Type::Nil;
  bool bool_ = false;
  int64_t int_ = 0;
  double double_ = 0.0;
  std::string string_;
  std::vector<XmlRpcValue> items_;
  std::vector<std::string> member_names_;
};

class XmlRpcError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

class XmlRpcFault : public XmlRpcError {
public:
  XmlRpcFault(int64_t code, const std::string& message)
    : XmlRpcError("XML-RPC fault " + std::to_string(code) + ": " + message), code_(code) {}

  int64_t code() const { return code_; }

private:
  int64_t code_ = 0;
};

std::string xmlrpc_encode_call(const std::string& method, const std::vector<XmlRpcValue>& params);

// Returns the single response parameter. Throws XmlRpcFault for <fault>
// responses and XmlRpcError for malformed documents.
XmlRpcValue xmlrpc_decode_response(const std::string& body);
