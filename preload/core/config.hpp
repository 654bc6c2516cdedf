#pragma once

#define PRELOAD_NAMESPACE preload

#define PRELOAD_NAMESPACE_BEGIN                                                \
    namespace preload                                                          \
    {

#define PRELOAD_NAMESPACE_END }

#define PRELOAD_ANONYMOUS_NAMESPACE_BEGIN                                      \
    PRELOAD_NAMESPACE_BEGIN namespace                                          \
    {

#define PRELOAD_ANONYMOUS_NAMESPACE_END                                        \
    }                                                                          \
    PRELOAD_NAMESPACE_END
