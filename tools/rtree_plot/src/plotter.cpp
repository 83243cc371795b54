#include "rtree_plot/plotter.hpp"

#include "rtree/tree_header.hpp"
#include "storage/file_page_store.hpp"

#include <algorithm>
#include <array>
#include <cmath>
#include <exception>
#include <iostream>
#include <string>

namespace fs = std::filesystem;

namespace rtreedb::plot {

Viewport::Viewport(const Rectangle& bounds, int width, int height)
    : min_x_(bounds.min()[0])
    , min_y_(bounds.min()[1]) {
    const double span_x = std::max(bounds.max()[0] - bounds.min()[0], 1e-9);
    const double span_y = std::max(bounds.max()[1] - bounds.min()[1], 1e-9);

    scale_ = std::min((width * 0.9) / span_x, (height * 0.9) / span_y);
    offset_x_ = (width - span_x * scale_) / 2.0;
    offset_y_ = height - (height - span_y * scale_) / 2.0;
}

RenderStyle style_for_level(int level) {
    static const std::array<RenderStyle::Color, 6> palette = {{
        {0.85, 0.20, 0.15, 0.9},
        {0.15, 0.45, 0.80, 0.9},
        {0.20, 0.65, 0.30, 0.9},
        {0.90, 0.60, 0.10, 0.9},
        {0.55, 0.30, 0.70, 0.9},
        {0.40, 0.40, 0.40, 0.9}
    }};

    if (level == 0) {
        return RenderStyle{
            .line_width = 0.5,
            .point_size = 1.5,
            .color = {0.1, 0.1, 0.1, 0.8},
            .filled = true,
            .stroked = true
        };
    }
    return RenderStyle{
        .line_width = 0.75 + 0.75 * level,
        .color = palette[static_cast<std::size_t>(level - 1) % palette.size()],
        .filled = false,
        .stroked = true
    };
}

struct TreePlotter::Impl {
    RTree& tree;
    int min_level;
    cairo_t* cr = nullptr;
    std::unique_ptr<Viewport> viewport;
    std::size_t shapes = 0;

    Impl(RTree& t, int level) : tree(t), min_level(level) {}

    void draw_rectangle(const Rectangle& rect, const RenderStyle& style) {
        const double x0 = viewport->to_x(rect.min()[0]);
        const double y0 = viewport->to_y(rect.max()[1]);
        const double x1 = viewport->to_x(rect.max()[0]);
        const double y1 = viewport->to_y(rect.min()[1]);

        cairo_set_source_rgba(cr, style.color.r, style.color.g, style.color.b, style.color.a);
        cairo_set_line_width(cr, style.line_width);

        // degenerate boxes are drawn as points
        if (x1 - x0 < 1.0 && y1 - y0 < 1.0) {
            cairo_arc(cr, (x0 + x1) / 2.0, (y0 + y1) / 2.0, style.point_size, 0, 2 * M_PI);
            cairo_fill(cr);
        } else {
            cairo_rectangle(cr, x0, y0, x1 - x0, y1 - y0);
            if (style.filled) {
                cairo_set_source_rgba(cr, style.color.r, style.color.g, style.color.b, style.color.a * 0.2);
                cairo_fill_preserve(cr);
                cairo_set_source_rgba(cr, style.color.r, style.color.g, style.color.b, style.color.a);
            }
            if (style.stroked) {
                cairo_stroke(cr);
            } else {
                cairo_new_path(cr);
            }
        }
        ++shapes;
    }

    void draw_node(NodeId node_id) {
        const Node node = tree.get_node(node_id);

        if (node.is_leaf()) {
            if (min_level <= 0) {
                const RenderStyle data_style = style_for_level(0);
                for (const auto& entry : node.entries()) {
                    draw_rectangle(entry.mbr, data_style);
                }
            }
        } else if (node.level() - 1 >= min_level) {
            for (const auto& entry : node.entries()) {
                draw_node(static_cast<NodeId>(entry.id));
            }
        }

        // parents are drawn over their children
        if (!node.empty() && node.level() >= min_level) {
            draw_rectangle(node.mbr(), style_for_level(node.level()));
        }
    }
};

TreePlotter::TreePlotter(RTree& tree, int min_level)
    : impl_(std::make_unique<Impl>(tree, min_level)) {}

TreePlotter::~TreePlotter() = default;

std::size_t TreePlotter::render(cairo_t* cr, int width, int height) {
    if (impl_->tree.dimensions() != 2) {
        throw ConfigurationError("Only 2-dimensional trees can be plotted");
    }

    impl_->shapes = 0;
    cairo_set_source_rgb(cr, 1.0, 1.0, 1.0);
    cairo_paint(cr);

    const auto bounds = impl_->tree.get_bounds();
    if (!bounds) {
        return 0;
    }

    impl_->cr = cr;
    impl_->viewport = std::make_unique<Viewport>(*bounds, width, height);
    impl_->draw_node(impl_->tree.root_node_id());
    impl_->cr = nullptr;
    return impl_->shapes;
}

int run_plot(const PlotConfig& config) {
    if (config.index_directory.empty()) {
        std::cerr << "[rtree_plot] Missing --index argument" << std::endl;
        return 1;
    }
    if (config.output_png.empty()) {
        std::cerr << "[rtree_plot] Missing --output argument" << std::endl;
        return 1;
    }
    if (config.width <= 0 || config.height <= 0) {
        std::cerr << "[rtree_plot] Image size must be positive" << std::endl;
        return 1;
    }

    const fs::path header_path = config.index_directory / "index.res";
    if (!fs::exists(header_path)) {
        std::cerr << "[rtree_plot] No index found in " << config.index_directory << std::endl;
        return 1;
    }

    cairo_surface_t* surface = cairo_image_surface_create(CAIRO_FORMAT_ARGB32, config.width, config.height);
    cairo_t* cr = cairo_create(surface);

    int exit_code = 0;
    try {
        const TreeHeader header = tree_header::read(header_path);
        if (header.max_node_entries < 2) {
            throw ConfigurationError("Index header carries an invalid fan-out");
        }
        storage::FilePageStore store(config.index_directory / "index.dat", 2,
                                     static_cast<std::size_t>(header.max_node_entries));
        RTree tree(2, store, header_path);
        tree.init(StorageKind::kDisk, header.min_node_entries, header.max_node_entries);

        TreePlotter plotter(tree, config.min_level);
        const std::size_t shapes = plotter.render(cr, config.width, config.height);
        tree.close();
        store.close();

        const cairo_status_t status = cairo_surface_write_to_png(surface, config.output_png.string().c_str());
        if (status != CAIRO_STATUS_SUCCESS) {
            std::cerr << "[rtree_plot] Failed to write " << config.output_png << ": "
                      << cairo_status_to_string(status) << std::endl;
            exit_code = 1;
        } else if (!config.quiet) {
            std::cout << "[rtree_plot] Drew " << shapes << " shapes of height " << header.tree_height
                      << " tree -> " << config.output_png << std::endl;
        }
    } catch (const std::exception& ex) {
        std::cerr << "[rtree_plot] Plot failed: " << ex.what() << std::endl;
        exit_code = 1;
    }

    cairo_destroy(cr);
    cairo_surface_destroy(surface);
    return exit_code;
}

}  // namespace rtreedb::plot
