#pragma once

namespace sparkline
{

struct Color;
struct Point;
struct Size;
struct Rect;
struct Bounds;

struct GradientStop;
struct Shader;
struct LinearGradient;

class Path;
struct PathCommand;

struct Paint;
struct TextStyle;
struct TextLayout;
class Canvas;
class RecordingCanvas;
class SvgCanvas;
struct DrawOp;

struct SparklineStyle;
class SparklineRenderer;
struct RenderInputs;
class PaintCache;

class SvgExporter;
class Logger;

}   // namespace sparkline
