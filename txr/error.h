#ifndef TAXRECON_ERROR_H
#define TAXRECON_ERROR_H
#include <string>
#include <exception>
#include <sstream>

namespace txr {

class TXRError : public std::exception {
    protected:
    std::string message;
    public:
    const char * what() const noexcept {
        return message.c_str();
    }
    template <typename T> TXRError& operator<<(const T&);
    void prepend(const std::string& s) {
        message = s + message;
    }
    TXRError() noexcept {}
    TXRError(const std::string & msg) noexcept :message(msg) {}
};

template <typename T>
TXRError& TXRError::operator<<(const T& t) {
  std::ostringstream oss;
  oss << message << t;
  message = oss.str();
  return *this;
}

// raised by lookups of sequence ids or lineage keys that are not in a store
class TXRNotFoundError : public TXRError {
    public:
    TXRNotFoundError() noexcept {}
    TXRNotFoundError(const std::string & msg) noexcept :TXRError(msg) {}
    template <typename T> TXRNotFoundError& operator<<(const T& t) {
        TXRError::operator<<(t);
        return *this;
    }
};

class TXRParsingError : public TXRError {
    public:
    TXRParsingError(const std::string & msg,
                    const std::string & fn,
                    std::size_t line_num) noexcept
        :TXRError(msg),
        filename(fn),
        line_number(line_num) {
        std::ostringstream oss;
        oss << "Error parsing \"" << filename << "\" at line " << line_number << ": " << msg;
        message = oss.str();
    }
    const std::string filename;
    const std::size_t line_number;
};

} //namespace txr
#endif
