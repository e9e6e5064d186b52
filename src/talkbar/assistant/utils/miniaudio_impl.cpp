// miniaudio 单头文件库的实现单元，整个工程只在此处展开
#define MINIAUDIO_IMPLEMENTATION
#include <miniaudio.h>
