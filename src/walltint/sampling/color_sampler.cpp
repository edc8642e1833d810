#include "walltint/sampling/color_sampler.hpp"

#include <algorithm>
#include <limits>

#include "walltint/color/color_math.hpp"
#include "walltint/log.hpp"
#include "walltint/sampling/image_source.hpp"

namespace walltint::sampling
{

  namespace
  {
    using color::Lab;

    double dist2(const Lab &x, const Lab &y) noexcept
    {
      const double dl = x.l - y.l;
      const double da = x.a - y.a;
      const double db = x.b - y.b;
      return dl * dl + da * da + db * db;
    }

    // Uniform stride over the row-major pixel array; transparent pixels carry no color.
    std::vector<Lab> strideSample(const sf::Image &image, std::size_t maxSamples)
    {
      std::vector<Lab> out;
      const sf::Vector2u size = image.getSize();
      const std::size_t total = static_cast<std::size_t>(size.x) * size.y;
      if (total == 0)
        return out;

      const std::size_t cap = std::max<std::size_t>(1, maxSamples);
      const std::size_t stride = (total + cap - 1) / cap;
      const sf::Uint8 *px = image.getPixelsPtr();

      out.reserve(total / stride + 1);
      for (std::size_t i = 0; i < total; i += stride)
      {
        const sf::Uint8 *p = px + i * 4;
        if (p[3] == 0)
          continue;
        out.push_back(color::toLab(sf::Color(p[0], p[1], p[2])));
      }
      return out;
    }

    std::size_t nearestIndex(const Lab &p, const std::vector<Lab> &centroids) noexcept
    {
      std::size_t best = 0;
      double bestD = std::numeric_limits<double>::max();
      for (std::size_t c = 0; c < centroids.size(); ++c)
      {
        const double d = dist2(p, centroids[c]);
        if (d < bestD)
        {
          bestD = d;
          best = c;
        }
      }
      return best;
    }

    std::vector<Lab> farthestPointSeeds(const std::vector<Lab> &pts, int k, double minDist)
    {
      Lab mean{};
      for (const Lab &p : pts)
      {
        mean.l += p.l;
        mean.a += p.a;
        mean.b += p.b;
      }
      const double n = static_cast<double>(pts.size());
      mean = Lab{mean.l / n, mean.a / n, mean.b / n};

      std::size_t first = 0;
      double firstD = std::numeric_limits<double>::max();
      for (std::size_t i = 0; i < pts.size(); ++i)
      {
        const double d = dist2(pts[i], mean);
        if (d < firstD)
        {
          firstD = d;
          first = i;
        }
      }

      std::vector<Lab> seeds{pts[first]};
      std::vector<double> nearest(pts.size());
      for (std::size_t i = 0; i < pts.size(); ++i)
        nearest[i] = dist2(pts[i], seeds.front());

      const double minD2 = minDist * minDist;
      while (static_cast<int>(seeds.size()) < k)
      {
        std::size_t far = 0;
        double farD = -1.0;
        for (std::size_t i = 0; i < pts.size(); ++i)
        {
          if (nearest[i] > farD)
          {
            farD = nearest[i];
            far = i;
          }
        }
        if (farD < minD2)
          break;

        seeds.push_back(pts[far]);
        for (std::size_t i = 0; i < pts.size(); ++i)
          nearest[i] = std::min(nearest[i], dist2(pts[i], pts[far]));
      }
      return seeds;
    }
  } // namespace

  ColorSampler::ColorSampler(const SamplerOptions &opts) : m_opts(opts)
  {
    m_opts.clusters = std::max(1, m_opts.clusters);
    m_opts.maxIterations = std::max(1, m_opts.maxIterations);
    m_opts.maxSamples = std::max<std::size_t>(1, m_opts.maxSamples);
  }

  std::vector<ColorSample> ColorSampler::sample(const sf::Image &image) const
  {
    const std::vector<Lab> pts = strideSample(image, m_opts.maxSamples);
    if (pts.empty())
      return {};

    std::vector<Lab> centroids = farthestPointSeeds(pts, m_opts.clusters, m_opts.minSeedDistance);
    std::vector<std::size_t> assignment(pts.size(), 0);

    for (int iter = 0; iter < m_opts.maxIterations; ++iter)
    {
      for (std::size_t i = 0; i < pts.size(); ++i)
        assignment[i] = nearestIndex(pts[i], centroids);

      std::vector<Lab> sums(centroids.size());
      std::vector<std::size_t> counts(centroids.size(), 0);
      for (std::size_t i = 0; i < pts.size(); ++i)
      {
        Lab &s = sums[assignment[i]];
        s.l += pts[i].l;
        s.a += pts[i].a;
        s.b += pts[i].b;
        ++counts[assignment[i]];
      }

      double maxShift = 0.0;
      for (std::size_t c = 0; c < centroids.size(); ++c)
      {
        if (counts[c] == 0)
          continue; // empty cluster keeps its centroid and is dropped below
        const double n = static_cast<double>(counts[c]);
        const Lab next{sums[c].l / n, sums[c].a / n, sums[c].b / n};
        maxShift = std::max(maxShift, color::deltaE(next, centroids[c]));
        centroids[c] = next;
      }
      if (maxShift <= m_opts.convergence)
        break;
    }

    std::vector<std::uint32_t> counts(centroids.size(), 0);
    for (const Lab &p : pts)
      ++counts[nearestIndex(p, centroids)];

    std::vector<ColorSample> out;
    out.reserve(centroids.size());
    for (std::size_t c = 0; c < centroids.size(); ++c)
    {
      if (counts[c] == 0)
        continue;
      const sf::Color rgb = color::fromLab(centroids[c]);
      // Distinct centroids may round to the same 8-bit color.
      auto same = std::find_if(out.begin(), out.end(), [&](const ColorSample &s)
                               { return s.color == rgb; });
      if (same != out.end())
        same->weight += counts[c];
      else
        out.push_back(ColorSample{rgb, counts[c]});
    }

    std::sort(out.begin(), out.end(), [](const ColorSample &a, const ColorSample &b)
              {
      if (a.weight != b.weight) return a.weight > b.weight;
      return color::packRgb(a.color) < color::packRgb(b.color); });

    log::debug("ColorSampler", pts.size(), " samples -> ", out.size(), " clusters");
    return out;
  }

  std::optional<std::vector<ColorSample>> ColorSampler::sampleFile(const ImageSource &source,
                                                                   const std::string &reference,
                                                                   ErrorCode *outError) const
  {
    sf::Image image;
    if (!source.load(reference, image, outError))
      return std::nullopt;
    return sample(image);
  }

} // namespace walltint::sampling
