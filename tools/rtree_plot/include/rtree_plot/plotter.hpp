#pragma once

#include "rtree/rtree.hpp"

#include <cairo.h>

#include <cstddef>
#include <filesystem>
#include <memory>
#include <vector>

namespace rtreedb::plot {

struct PlotConfig {
    std::filesystem::path index_directory;
    std::filesystem::path output_png;
    int width = 1024;
    int height = 1024;
    // Levels below this are not drawn; 0 draws the data entries too.
    int min_level = 0;
    bool quiet = false;
};

// Maps tree coordinates onto the image, y growing upwards.
class Viewport {
public:
    Viewport(const Rectangle& bounds, int width, int height);

    [[nodiscard]] double to_x(double x) const { return offset_x_ + (x - min_x_) * scale_; }
    [[nodiscard]] double to_y(double y) const { return offset_y_ - (y - min_y_) * scale_; }
    [[nodiscard]] double scale() const { return scale_; }

private:
    double min_x_;
    double min_y_;
    double scale_;
    double offset_x_;
    double offset_y_;
};

struct RenderStyle {
    double line_width = 1.0;
    double point_size = 2.0;
    struct Color { double r, g, b, a; } color = {0.0, 0.0, 0.0, 1.0};
    bool filled = false;
    bool stroked = true;
};

// Style for node MBRs at `level`; level 0 is used for data entries.
[[nodiscard]] RenderStyle style_for_level(int level);

class TreePlotter {
public:
    TreePlotter(RTree& tree, int min_level);
    ~TreePlotter();

    // Draws every node from the root down; returns the number of shapes drawn.
    std::size_t render(cairo_t* cr, int width, int height);

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

int run_plot(const PlotConfig& config);

}  // namespace rtreedb::plot
