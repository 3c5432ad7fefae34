#ifndef LIBTFS_BASEEXCEPTION_H_
#define LIBTFS_BASEEXCEPTION_H_

#include <stdexcept>

namespace TreeFS {

/** Base Exception for all TreeFS errors */
class BaseException : public std::runtime_error 
{ 
    using std::runtime_error::runtime_error; 
};

} // namespace TreeFS

#endif // LIBTFS_BASEEXCEPTION_H_
