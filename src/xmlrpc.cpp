#include "xmlrpc.hpp"

#include <expat.h>

#include <cstdlib>
#include <cstring>
#include <memory>
#include <sstream>

namespace {

std::string xml_escape(const std::string& in) {
  std::string out;
  out.reserve(in.size());
  for(char c : in) {
    switch(c) {
      case '&': out += "&amp;"; break;
      case '<': out += "&lt;"; break;
      case '>': out += "&gt;"; break;
      case '"': out += "&quot;"; break;
      default: out += c; break;
    }
  }
  return out;
}

const char* type_name(XmlRpcValue::Type type) {
  switch(type) {
    case XmlRpcValue::Type::Nil: return "nil";
    case XmlRpcValue::Type::Bool: return "boolean";
    case XmlRpcValue::Type::Int: return "int";
    case XmlRpcValue::Type::Double: return "double";
    case XmlRpcValue::Type::String: return "string";
    case XmlRpcValue::Type::Array: return "array";
    case XmlRpcValue::Type::Struct: return "struct";
  }
  return "unknown";
}

[[noreturn]] void type_mismatch(const char* wanted, XmlRpcValue::Type actual) {
  throw XmlRpcError(std::string("expected ") + wanted + ", got " + type_name(actual));
}

std::string trim(const std::string& in) {
  auto first = in.find_first_not_of(" \t\r\n");
  if(first == std::string::npos) return "";
  auto last = in.find_last_not_of(" \t\r\n");
  return in.substr(first, last - first + 1);
}

} // namespace

XmlRpcValue::XmlRpcValue(bool value) : type_(Type::Bool), bool_(value) {}
XmlRpcValue::XmlRpcValue(int value) : type_(Type::Int), int_(value) {}
XmlRpcValue::XmlRpcValue(int64_t value) : type_(Type::Int), int_(value) {}
XmlRpcValue::XmlRpcValue(double value) : type_(Type::Double), double_(value) {}
XmlRpcValue::XmlRpcValue(std::string value) : type_(Type::String), string_(std::move(value)) {}
XmlRpcValue::XmlRpcValue(const char* value) : type_(Type::String), string_(value ? value : "") {}

XmlRpcValue XmlRpcValue::array(std::vector<XmlRpcValue> items) {
  XmlRpcValue v;
  v.type_ = Type::Array;
  v.items_ = std::move(items);
  return v;
}

XmlRpcValue XmlRpcValue::structure() {
  XmlRpcValue v;
  v.type_ = Type::Struct;
  return v;
}

bool XmlRpcValue::as_bool() const {
  if(type_ == Type::Bool) return bool_;
  if(type_ == Type::Int) return int_ != 0;
  type_mismatch("boolean", type_);
}

int64_t XmlRpcValue::as_int() const {
  if(type_ == Type::Int) return int_;
  if(type_ == Type::Bool) return bool_ ? 1 : 0;
  type_mismatch("int", type_);
}

double XmlRpcValue::as_double() const {
  if(type_ == Type::Double) return double_;
  if(type_ == Type::Int) return static_cast<double>(int_);
  type_mismatch("double", type_);
}

const std::string& XmlRpcValue::as_string() const {
  if(type_ == Type::String) return string_;
  type_mismatch("string", type_);
}

const std::vector<XmlRpcValue>& XmlRpcValue::as_array() const {
  if(type_ == Type::Array) return items_;
  type_mismatch("array", type_);
}

void XmlRpcValue::push_back(XmlRpcValue item) {
  if(type_ != Type::Array) type_mismatch("array", type_);
  items_.push_back(std::move(item));
}

void XmlRpcValue::set_member(const std::string& name, XmlRpcValue value) {
  if(type_ != Type::Struct) type_mismatch("struct", type_);
  for(std::size_t i = 0; i < member_names_.size(); ++i) {
    if(member_names_[i] == name) {
      items_[i] = std::move(value);
      return;
    }
  }
  member_names_.push_back(name);
  items_.push_back(std::move(value));
}

const XmlRpcValue* XmlRpcValue::member(const std::string& name) const {
  if(type_ != Type::Struct) return nullptr;
  for(std::size_t i = 0; i < member_names_.size(); ++i) {
    if(member_names_[i] == name) return &items_[i];
  }
  return nullptr;
}

std::string XmlRpcValue::to_xml() const {
  std::ostringstream oss;
  oss << "<value>";
  switch(type_) {
    case Type::Nil: oss << "<nil/>"; break;
    case Type::Bool: oss << "<boolean>" << (bool_ ? 1 : 0) << "</boolean>"; break;
    case Type::Int:
      if(int_ >= INT32_MIN && int_ <= INT32_MAX) oss << "<i4>" << int_ << "</i4>";
      else oss << "<i8>" << int_ << "</i8>";
      break;
    case Type::Double: oss << "<double>" << double_ << "</double>"; break;
    case Type::String: oss << "<string>" << xml_escape(string_) << "</string>"; break;
    case Type::Array:
      oss << "<array><data>";
      for(const auto& item : items_) oss << item.to_xml();
      oss << "</data></array>";
      break;
    case Type::Struct:
      oss << "<struct>";
      for(std::size_t i = 0; i < member_names_.size(); ++i) {
        oss << "<member><name>" << xml_escape(member_names_[i]) << "</name>"
            << items_[i].to_xml() << "</member>";
      }
      oss << "</struct>";
      break;
  }
  oss << "</value>";
  return oss.str();
}

std::string xmlrpc_encode_call(const std::string& method, const std::vector<XmlRpcValue>& params) {
  std::ostringstream oss;
  oss << "<?xml version=\"1.0\"?><methodCall><methodName>" << xml_escape(method)
      << "</methodName><params>";
  for(const auto& param : params) {
    oss << "<param>" << param.to_xml() << "</param>";
  }
  oss << "</params></methodCall>";
  return oss.str();
}

// Expat visitor building one value tree from a <methodResponse>.
class XmlRpcResponseParser {
public:
  void start_element(const char* name) {
    text_.clear();
    const std::string tag(name);
    if(tag == "value") {
      frames_.push_back(Frame{});
      return;
    }
    if(tag == "fault") {
      fault_ = true;
      return;
    }
    if(frames_.empty()) return;
    Frame& top = frames_.back();
    if(tag == "array") {
      top.value.type_ = XmlRpcValue::Type::Array;
      top.typed = true;
    } else if(tag == "struct") {
      top.value.type_ = XmlRpcValue::Type::Struct;
      top.typed = true;
    } else if(tag == "nil") {
      top.value.type_ = XmlRpcValue::Type::Nil;
      top.typed = true;
    }
  }

  void end_element(const char* name) {
    const std::string tag(name);
    if(tag == "value") {
      Frame done = std::move(frames_.back());
      frames_.pop_back();
      if(!done.typed) {
        done.value = XmlRpcValue(done.untyped_text);
      }
      attach(std::move(done.value));
      text_.clear();
      return;
    }
    if(frames_.empty()) {
      text_.clear();
      return;
    }
    Frame& top = frames_.back();
    if(tag == "name") {
      top.pending_name = text_;
    } else if(tag == "string") {
      top.value = XmlRpcValue(text_);
      top.typed = true;
    } else if(tag == "i4" || tag == "int" || tag == "i8") {
      top.value = XmlRpcValue(static_cast<int64_t>(std::strtoll(trim(text_).c_str(), nullptr, 10)));
      top.typed = true;
    } else if(tag == "boolean") {
      top.value = XmlRpcValue(trim(text_) == "1");
      top.typed = true;
    } else if(tag == "double") {
      top.value = XmlRpcValue(std::strtod(trim(text_).c_str(), nullptr));
      top.typed = true;
    }
    text_.clear();
  }

  void data(const char* s, int len) {
    text_.append(s, static_cast<std::size_t>(len));
    if(!frames_.empty() && !frames_.back().typed) {
      frames_.back().untyped_text.append(s, static_cast<std::size_t>(len));
    }
  }

  XmlRpcValue take_result() {
    if(!have_result_) throw XmlRpcError("XML-RPC response carried no value");
    if(fault_) {
      int64_t code = 0;
      std::string message = "unknown fault";
      if(const auto* c = result_.member("faultCode")) code = c->as_int();
      if(const auto* m = result_.member("faultString")) message = m->as_string();
      throw XmlRpcFault(code, message);
    }
    return std::move(result_);
  }

private:
  struct Frame {
    XmlRpcValue value;
    bool typed = false;
    std::string untyped_text;
    std::string pending_name;
  };

  void attach(XmlRpcValue value) {
    if(frames_.empty()) {
      if(!have_result_) {
        result_ = std::move(value);
        have_result_ = true;
      }
      return;
    }
    Frame& parent = frames_.back();
    if(parent.value.type_ == XmlRpcValue::Type::Array) {
      parent.value.items_.push_back(std::move(value));
    } else if(parent.value.type_ == XmlRpcValue::Type::Struct) {
      parent.value.set_member(parent.pending_name, std::move(value));
      parent.pending_name.clear();
    }
  }

  std::vector<Frame> frames_;
  std::string text_;
  XmlRpcValue result_;
  bool have_result_ = false;
  bool fault_ = false;
};

namespace {

struct ParserDeleter {
  void operator()(XML_ParserStruct* p) const { XML_ParserFree(p); }
};

void XMLCALL on_start(void* user, const XML_Char* name, const XML_Char**) {
  static_cast<XmlRpcResponseParser*>(user)->start_element(name);
}

void XMLCALL on_end(void* user, const XML_Char* name) {
  static_cast<XmlRpcResponseParser*>(user)->end_element(name);
}

void XMLCALL on_data(void* user, const XML_Char* s, int len) {
  static_cast<XmlRpcResponseParser*>(user)->data(s, len);
}

} // namespace

XmlRpcValue xmlrpc_decode_response(const std::string& body) {
  std::unique_ptr<XML_ParserStruct, ParserDeleter> parser(XML_ParserCreate(nullptr));
  if(!parser) throw XmlRpcError("XML_ParserCreate failed");

  XmlRpcResponseParser visitor;
  XML_SetUserData(parser.get(), &visitor);
  XML_SetElementHandler(parser.get(), on_start, on_end);
  XML_SetCharacterDataHandler(parser.get(), on_data);

  if(XML_Parse(parser.get(), body.data(), static_cast<int>(body.size()), 1) == XML_STATUS_ERROR) {
    throw XmlRpcError(std::string("malformed XML-RPC response: ") +
                      XML_ErrorString(XML_GetErrorCode(parser.get())) +
                      " at line " + std::to_string(XML_GetCurrentLineNumber(parser.get())));
  }
  return visitor.take_result();
}
