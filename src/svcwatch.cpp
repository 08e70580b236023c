#include <svcwatch/impl.hpp>
