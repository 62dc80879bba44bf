#pragma once

#include <functional>
#include <string>

namespace sheetscape
{

// Contains exceptions escaping a frame. After the first failure the host
// shows the diagnostic screen until reset() is called.
class DiagnosticBoundary
{
   public:
    static constexpr const char* HEADLINE = "Something went wrong";

    // Returns false when `fn` threw; the error is logged and latched.
    bool run(const std::function<void()>& fn);

    bool               has_error() const { return has_error_; }
    const std::string& message() const { return message_; }
    void               reset();

   private:
    bool        has_error_ = false;
    std::string message_;
};

}   // namespace sheetscape
