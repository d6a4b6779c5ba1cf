#ifndef ISC_BIOT_MODEL_HPP
#define ISC_BIOT_MODEL_HPP

#include "ContactMechanicsBiot.hpp"
#include "FractureNetwork.hpp"
#include "IscData.hpp"
#include "WellTagger.hpp"
#include <memory>

namespace GTS {

/**
 * @brief Biot model of the ISC stimulation experiment at the Grimsel Test Site
 *
 * Domain: the bounding box cut by the requested shear zones, meshed with the
 * configured mesher into <output folder>/gmsh_frac_file. Fluid is injected
 * into the cell of the target shear zone closest to its intersection with
 * the injection borehole. Flow boundary conditions: Dirichlet (0) on the
 * bottom, Neumann elsewhere with value 1 on the top. After every step the
 * slip tendency of the fracture cells under the in-situ stress is evaluated.
 */
class IscBiotModel : public ContactMechanicsBiot {
public:
    /**
     * @brief Load the intersection table from config.data_path and fit the
     *        shear zones; builds the grid and tags the well cells
     */
    IscBiotModel(SimulationContext& ctx, const SimulationConfig& config);

    /**
     * @param table    Borehole / shear-zone intersections
     * @param network  Shear zones (one per name in config.shearzone_names)
     * @param gb       Prebuilt grid bucket; created from the network if null
     */
    IscBiotModel(SimulationContext& ctx, const SimulationConfig& config,
                 IntersectionTable table, FractureNetwork network,
                 std::shared_ptr<GridBucket> gb = nullptr);

    /**
     * @brief Build the grid bucket unless one exists
     *
     * On reuse only checks that the fracture grids carry their names.
     * @throws std::logic_error if a fracture grid has no name
     */
    void createGrid(bool overwrite = false) override;

    BoundaryCondition bcTypeScalar(const Grid& g) const override;
    std::vector<double> bcValuesScalar(const Grid& g) const override;
    std::vector<double> sourceScalar(const Grid& g) const override;

    void afterNewtonConvergence(const std::vector<double>& solution, double error,
                                int iterations) override;
    void exportStep() override;

    // 3 l/s scaled to the model length unit
    double sourceFlowRate() const;

    // Tag the injection cell on every grid
    WellTag wellCells();

    const IntersectionTable& intersections() const { return table_; }
    const FractureNetwork& network() const { return network_; }
    const WellTag& wellTag() const { return well_; }

    const Tensor3& stress() const { return stress_; }
    void setStress(const Tensor3& stress) { stress_ = stress; }
    double maxSlipTendency() const { return max_slip_tendency_; }

private:
    void initialize(std::shared_ptr<GridBucket> gb);
    void adoptGridBucket(std::shared_ptr<GridBucket> gb);

    IntersectionTable table_;
    FractureNetwork network_;
    Tensor3 stress_;
    WellTag well_;
    double max_slip_tendency_ = 0.0;
};

} // namespace GTS

#endif // ISC_BIOT_MODEL_HPP
