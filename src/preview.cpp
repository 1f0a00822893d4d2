#include "preview.hpp"
#include <opencv2/imgproc.hpp>
#include <algorithm>
#include <cmath>
#include <string>
using namespace cv;
using std::vector;

cv::Size thumbnail_size(const cv::Size& full, int max_side) {
    CV_Assert(full.width > 0 && full.height > 0 && max_side > 0);
    double s = std::min({ (double)max_side / full.width, (double)max_side / full.height, 1.0 });
    return Size(std::max(1, (int)(full.width * s)), std::max(1, (int)(full.height * s)));
}

const std::vector<cv::Vec3b>& preview_palette() {
    static const vector<Vec3b> pal = {
        {230, 25, 75},   {60, 180, 75},   {255, 225, 25},  {0, 130, 200},
        {245, 130, 48},  {145, 30, 180},  {70, 240, 240},  {240, 50, 230},
        {210, 245, 60},  {250, 190, 212}, {0, 128, 128},   {220, 190, 255},
        {170, 110, 40},  {255, 250, 200}, {128, 0, 0},     {170, 255, 195},
        {128, 128, 0},   {255, 215, 180}, {0, 0, 128},     {128, 128, 128},
    };
    return pal;
}

PreviewRenderer::PreviewRenderer(const cv::Mat& rgb, const PreviewParams& params)
    : params_(params), full_(rgb.size()) {
    CV_Assert(!rgb.empty() && rgb.type() == CV_8UC3);
    Size ts = thumbnail_size(full_, params_.max_side);
    if (ts == full_) thumb_ = rgb.clone();
    else resize(rgb, thumb_, ts, 0, 0, INTER_LINEAR);
    overlay_ = thumb_.clone();
}

void PreviewRenderer::update(const cv::Mat& labels, const std::vector<Particle>& particles) {
    CV_Assert(labels.size() == full_ && labels.type() == CV_32S);

    Mat small;
    resize(labels, small, thumb_.size(), 0, 0, INTER_NEAREST);

    const vector<Vec3b>& pal = preview_palette();
    const double a = params_.blend;
    overlay_ = thumb_.clone();
    for (int y = 0; y < small.rows; ++y) {
        const int* l = small.ptr<int>(y);
        Vec3b* px = overlay_.ptr<Vec3b>(y);
        for (int x = 0; x < small.cols; ++x) {
            if (l[x] <= 0) continue;
            const Vec3b& c = pal[(l[x] - 1) % pal.size()];
            for (int k = 0; k < 3; ++k)
                px[x][k] = saturate_cast<uchar>(px[x][k] * (1.0 - a) + c[k] * a);
        }
    }

    const double sx = (double)thumb_.cols / full_.width;
    const double sy = (double)thumb_.rows / full_.height;
    centroids_.clear();
    centroids_.reserve(particles.size());
    for (const auto& p : particles) centroids_.emplace_back(p.centroid.x * sx, p.centroid.y * sy);
}

PreviewRenderer::Placement PreviewRenderer::place(const cv::Size& viewport) const {
    double base = std::min((double)viewport.width / thumb_.cols, (double)viewport.height / thumb_.rows);
    Placement pl;
    pl.scale = base * view_.zoom;
    pl.x0 = (viewport.width - thumb_.cols * pl.scale) / 2.0 + view_.offset_x;
    pl.y0 = (viewport.height - thumb_.rows * pl.scale) / 2.0 + view_.offset_y;
    return pl;
}

cv::Mat PreviewRenderer::render(const cv::Size& viewport) const {
    Mat canvas(std::max(0, viewport.height), std::max(0, viewport.width), CV_8UC3, params_.background);
    if (viewport.width < 2 || viewport.height < 2) return canvas;

    const Placement pl = place(viewport);

    // visible part of the thumbnail
    auto bounded = [](double v, int hi) { return (int)std::min(std::max(v, 0.0), (double)hi); };
    int tx0 = bounded(-pl.x0 / pl.scale, thumb_.cols);
    int ty0 = bounded(-pl.y0 / pl.scale, thumb_.rows);
    int tx1 = std::min(thumb_.cols, bounded((viewport.width - pl.x0) / pl.scale, thumb_.cols) + 1);
    int ty1 = std::min(thumb_.rows, bounded((viewport.height - pl.y0) / pl.scale, thumb_.rows) + 1);
    if (tx1 <= tx0 || ty1 <= ty0) return canvas;

    // crop first so the resize cost follows the viewport, not the zoom
    Mat crop = overlay_(Rect(tx0, ty0, tx1 - tx0, ty1 - ty0));
    int cw = std::max(1, (int)((tx1 - tx0) * pl.scale));
    int ch = std::max(1, (int)((ty1 - ty0) * pl.scale));
    Mat scaled;
    resize(crop, scaled, Size(cw, ch), 0, 0,
           view_.zoom > params_.nearest_zoom ? INTER_NEAREST : INTER_LINEAR);

    int px = (int)std::floor(pl.x0 + tx0 * pl.scale);
    int py = (int)std::floor(pl.y0 + ty0 * pl.scale);
    Rect dst = Rect(px, py, cw, ch) & Rect(0, 0, viewport.width, viewport.height);
    if (!dst.empty())
        scaled(Rect(dst.x - px, dst.y - py, dst.width, dst.height)).copyTo(canvas(dst));

    draw_labels(canvas, pl);
    return canvas;
}

void PreviewRenderer::draw_labels(cv::Mat& canvas, const Placement& pl) const {
    const int font_px = std::max(7, std::min(12, (int)(8 * view_.zoom)));
    const double fs = font_px / 24.0;
    const int m = params_.label_margin;

    for (size_t i = 0; i < centroids_.size(); ++i) {
        double dx = pl.x0 + centroids_[i].x * pl.scale;
        double dy = pl.y0 + centroids_[i].y * pl.scale;
        if (dx <= -m || dx >= canvas.cols + m || dy <= -m || dy >= canvas.rows + m) continue;

        const std::string txt = std::to_string(i + 1);
        int base = 0;
        Size ts = getTextSize(txt, FONT_HERSHEY_SIMPLEX, fs, 1, &base);
        Point org((int)std::lround(dx) - ts.width / 2, (int)std::lround(dy) + ts.height / 2);
        putText(canvas, txt, org + Point(1, 1), FONT_HERSHEY_SIMPLEX, fs, Scalar(0, 0, 0), 1, LINE_AA);
        putText(canvas, txt, org, FONT_HERSHEY_SIMPLEX, fs, Scalar(255, 255, 255), 1, LINE_AA);
    }
}

void PreviewRenderer::zoom_at(const cv::Point2d& cursor, double factor, const cv::Size& viewport) {
    const double old = view_.zoom;
    view_.zoom = std::max(params_.min_zoom, std::min(old * factor, params_.max_zoom));
    const double r = view_.zoom / old;
    // keeps the image point under the cursor fixed
    view_.offset_x = (1.0 - r) * (cursor.x - viewport.width / 2.0) + r * view_.offset_x;
    view_.offset_y = (1.0 - r) * (cursor.y - viewport.height / 2.0) + r * view_.offset_y;
}

void PreviewRenderer::pan(double dx, double dy) {
    view_.offset_x += dx;
    view_.offset_y += dy;
}

void PreviewRenderer::set_view(const ViewState& v) {
    view_ = v;
    view_.zoom = std::max(params_.min_zoom, std::min(v.zoom, params_.max_zoom));
}

cv::Point2d PreviewRenderer::canvas_to_image(const cv::Point2d& pt, const cv::Size& viewport) const {
    const Placement pl = place(viewport);
    double tx = (pt.x - pl.x0) / pl.scale;
    double ty = (pt.y - pl.y0) / pl.scale;
    return Point2d(tx * full_.width / thumb_.cols, ty * full_.height / thumb_.rows);
}

bool PreviewRenderer::contains(const cv::Point2d& pt, const cv::Size& viewport) const {
    const Placement pl = place(viewport);
    double tx = (pt.x - pl.x0) / pl.scale;
    double ty = (pt.y - pl.y0) / pl.scale;
    return tx >= 0 && tx < thumb_.cols && ty >= 0 && ty < thumb_.rows;
}

double PreviewRenderer::canvas_scale(const cv::Size& viewport) const {
    return place(viewport).scale * thumb_.cols / full_.width;
}
