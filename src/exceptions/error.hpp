// Copyright (c) 2026 The tiledown authors
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#ifndef error_hpp
#define error_hpp

#include <exception>
#include <string>

namespace tiledown {

/**
 Root of all tiledown exceptions. Each error is described in four parts so the handler
 can report it consistently:
   type  - who is at fault (user, program, system)
   where - a hint for debugging, usually the throwing function
   why   - what went wrong
   help  - how to resolve it
 */
class Error : public std::exception
{
public:
    virtual ~Error() override = default;
    
    std::string type() const { return do_type(); }
    std::string where() const { return do_where(); }
    std::string why() const { return do_why(); }
    std::string help() const { return do_help(); }
    
    const char* what() const noexcept override;
    
private:
    virtual std::string do_type() const  = 0;
    virtual std::string do_where() const = 0;
    virtual std::string do_why() const   = 0;
    virtual std::string do_help() const  = 0;
    
    mutable std::string what_;
};

} // namespace tiledown

#endif
