#ifndef LOGUTIL_H
#define LOGUTIL_H

#include <qdebug.h>

// 逐帧日志量很大，只在定义 LS_DEBUG 时编译进来
#ifdef LS_DEBUG
#ifdef _MSC_VER
#define LS_LOG_DEBUG(fmt, ...) qDebug("[%s,%d] DEBUG:" fmt "\n",__FUNCTION__,__LINE__,##__VA_ARGS__)
#else
#define LS_LOG_DEBUG(fmt, ...) qDebug("[%s,%d] DEBUG:" fmt "\n",__PRETTY_FUNCTION__,__LINE__,##__VA_ARGS__)
#endif
#else
#define LS_LOG_DEBUG(fmt, ...)
#endif

#ifdef _MSC_VER
#define LS_LOG_INFO(fmt, ...) qDebug("[%s,%d] INFO:" fmt "\n",__FUNCTION__,__LINE__,##__VA_ARGS__)
#define LS_LOG_WARN(fmt, ...) qWarning("[%s,%d] WARN:" fmt "\n",__FUNCTION__,__LINE__,##__VA_ARGS__)
#define LS_LOG_ERROR(fmt, ...) qCritical("[%s,%d] ERROR:" fmt "\n",__FUNCTION__,__LINE__,##__VA_ARGS__)
#else
#define LS_LOG_INFO(fmt, ...) qDebug("[%s,%d] INFO:" fmt "\n",__PRETTY_FUNCTION__,__LINE__,##__VA_ARGS__)
#define LS_LOG_WARN(fmt, ...) qWarning("[%s,%d] WARN:" fmt "\n",__PRETTY_FUNCTION__,__LINE__,##__VA_ARGS__)
#define LS_LOG_ERROR(fmt, ...) qCritical("[%s,%d] ERROR:" fmt "\n",__PRETTY_FUNCTION__,__LINE__,##__VA_ARGS__)
#endif

#endif // LOGUTIL_H
