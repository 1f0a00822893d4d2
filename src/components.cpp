#include "components.hpp"
#include <opencv2/imgproc.hpp>
#include <algorithm>
using namespace cv;
using std::vector;

ComponentResult extract_components(cv::Mat& mask, int min_area, int connectivity) {
    CV_Assert(!mask.empty() && mask.type() == CV_8U);
    CV_Assert(connectivity == 4 || connectivity == 8);

    ComponentResult out;
    Mat raw, stats, cents;
    int n = connectedComponentsWithStats(mask, raw, stats, cents, connectivity, CV_32S);

    // raw id -> new rank (0 = dropped)
    vector<int> remap(n, 0);
    struct Comp { int id; int area; };
    vector<Comp> kept; kept.reserve(n);
    for (int id = 1; id < n; ++id) {
        int a = stats.at<int>(id, CC_STAT_AREA);
        if (a < min_area) continue;
        kept.push_back({ id, a });
    }
    std::stable_sort(kept.begin(), kept.end(), [](const Comp& a, const Comp& b){ return a.area > b.area; });

    out.particles.reserve(kept.size());
    for (int i = 0; i < (int)kept.size(); ++i) {
        remap[kept[i].id] = i + 1;
        Point2d c(cents.at<double>(kept[i].id, 0), cents.at<double>(kept[i].id, 1));
        out.particles.push_back(Particle{ i + 1, kept[i].area, c });
    }

    out.labels = Mat::zeros(mask.size(), CV_32S);
    if (n <= 1) return out;

    for (int y = 0; y < raw.rows; ++y) {
        const int* src = raw.ptr<int>(y);
        int* dst = out.labels.ptr<int>(y);
        uchar* m = mask.ptr<uchar>(y);
        for (int x = 0; x < raw.cols; ++x) {
            if (!src[x]) continue;
            int r = remap[src[x]];
            dst[x] = r;
            if (!r) m[x] = 0; // below min_area
        }
    }
    return out;
}
